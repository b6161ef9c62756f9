#pragma once
#include <Arduino.h>
#include <ArduinoJson.h>
#include "ph_manager.h"

namespace PhProto {

// Fuentes de medición opcionales (ADS1115 / DS18B20 en la placa)
using ReadMillivoltsFn  = bool (*)(float& mv);
using ReadTemperatureFn = bool (*)(float& tempC);

/**
 * Consola NDJSON sobre un Stream: una petición por línea, una respuesta por línea.
 *
 *   -> {"op":"read_ph","data":{"mv":1515}}
 *   <- {"ok":true,"data":{"mv":1515,"ph":6.92}}
 *   <- {"ok":false,"error":"BAD_ARGS"}
 */
class SerialManager {
public:
  static constexpr size_t kMaxLine = 1024;

  SerialManager(Stream& inOut, PHManager& ph);

  void setMillivoltSource(ReadMillivoltsFn fn)   { readMv_ = fn; }
  void setTemperatureSource(ReadTemperatureFn fn) { readTemp_ = fn; }

  // Lee bytes disponibles y responde cada línea completa
  void loop();

  // Procesa una línea y devuelve la respuesta serializada (sin '\n')
  String handleLine(const String& line);

private:
  Stream& io_;
  PHManager& ph_;
  String lineBuf_;
  bool discarding_ = false;  // línea larga: se ignora hasta el próximo '\n'

  ReadMillivoltsFn  readMv_ = nullptr;
  ReadTemperatureFn readTemp_ = nullptr;

  // Handlers, llenan out["data"] o devuelven el código de error
  const char* handleReadPh_(JsonObjectConst in, JsonObject out);
  const char* handleCalibrate_(const char* op, JsonObjectConst in, JsonObject out);
  const char* handleSetCalibration_(JsonObjectConst in, JsonObject out);
  const char* handleSetCoefficients_(JsonObjectConst in, JsonObject out);

  // mV del request o, si falta, de la fuente configurada
  const char* resolveMillivolts_(JsonObjectConst in, float& mv);

  void addCalibration_(JsonObject out) const;
  const char* statusCode_() const;

  static String errorReply_(const char* code);
};

} // namespace PhProto

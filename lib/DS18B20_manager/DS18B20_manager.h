#ifndef DS18B20_MANAGER_H
#define DS18B20_MANAGER_H

#include <Arduino.h>
#include <OneWire.h>
#include <DallasTemperature.h>

/**
 * Temperatura de la solución para compensar la lectura de pH.
 * Descubre hasta MAX_SENSORS sondas al iniciar; la compensación usa la 0.
 * Lecturas bloqueantes.
 */
class DS18B20Manager {
public:
  static constexpr uint8_t MAX_SENSORS = 8;

  explicit DS18B20Manager(uint8_t dataPin, uint8_t resolutionBits = 12);

  /** Inicializa y descubre sondas. Retorna cantidad detectada (0 si no hay). */
  uint8_t begin();

  uint8_t sensorCount() const { return _count; }

  /** °C de la sonda index. NAN si no responde o el índice no existe. */
  float readC(uint8_t index = 0);

private:
  uint8_t           _resolution;   // 9..12
  OneWire           _ow;
  DallasTemperature _dt;

  uint8_t       _count = 0;
  DeviceAddress _addr[MAX_SENSORS];

  float _norm(float c) const;  // DEVICE_DISCONNECTED_C -> NAN
};

#endif // DS18B20_MANAGER_H

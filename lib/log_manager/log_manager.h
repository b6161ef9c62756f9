#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <Arduino.h>

/**
 * Log de texto por líneas hacia un Stream (Serial USB en la placa).
 * Cada módulo antepone su etiqueta: "[PH] ...", "[STORE] ...", "[ADS] ...".
 * No debe compartir Stream con la consola NDJSON (va por Serial2).
 */
class LogManager {
public:
  // Debe llamarse después de Serial.begin(...)
  void begin(Stream& out);

  void log(const String& message);

private:
  Stream* out_ = nullptr;
};

// Instancia única, compartida por todas las librerías
extern LogManager logger;

#endif // LOG_MANAGER_H

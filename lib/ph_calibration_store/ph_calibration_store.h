#pragma once
#include <Arduino.h>
#include <FS.h>

// Calibración de 2 puntos (buffers pH 7 y pH 4) y la recta derivada
struct PHCalibration {
  float V7;         // mV medidos en buffer pH 7
  float V4;         // mV medidos en buffer pH 4
  float slope;      // pH por mV
  float intercept;  // pH a 0 mV
};

/**
 * Persistencia de la calibración de pH en un archivo JSON sobre un fs::FS
 * (LittleFS en la placa, también sirve SD).
 *
 * Formato:
 *   {"neutral_voltage":1500.0,"acid_voltage":2032.44,
 *    "slope":-0.005634,"intercept":15.45,"version":1}
 *
 * Sin calibrar la recta es identidad (slope=1, intercept=0) con los puntos
 * nominales de la sonda DFRobot. Si el archivo no trae slope/intercept se
 * derivan de neutral_voltage/acid_voltage.
 */
class PHCalibrationStore {
public:
  // pH de los buffers de referencia
  static constexpr float kPH7 = 7.0f;
  static constexpr float kPH4 = 4.0f;

  // Sonda DFRobot nominal (sin calibrar)
  static constexpr float kDefaultV7 = 1500.0f;
  static constexpr float kDefaultV4 = 2032.44f;

  // Ventanas válidas (intervalos abiertos, en mV)
  static constexpr float kV7Min = 1322.0f;
  static constexpr float kV7Max = 1678.0f;
  static constexpr float kV4Min = 1854.0f;
  static constexpr float kV4Max = 2210.0f;

  static constexpr uint16_t kVersion = 1;

  // makeDirs=true crea el directorio padre al guardar si no existe
  bool begin(fs::FS& fs, const char* path = "/ph/ph_calibration_data.json", bool makeDirs = true);

  // Carga la calibración. Si el archivo no existe o está corrupto deja
  // valores por defecto en cal y devuelve false (no es un error fatal).
  bool load(PHCalibration& cal);

  // Reemplaza el archivo completo (escribe .tmp y renombra)
  bool save(const PHCalibration& cal);

  bool exists() const;
  bool remove();

  const String& path() const { return _path; }
  const char* lastError() const { return _err; }

  // ---- Helpers de modelo ----
  static PHCalibration defaults();
  // Recta por (V7, 7) y (V4, 4). false si V7≈V4 o no son finitos.
  static bool fitTwoPoint(float V7, float V4, PHCalibration& out);
  // slope finito y distinto de 0, intercept finito
  static bool isValidCoeffs(float slope, float intercept);
  static bool isValidPH7Voltage(float mv);
  static bool isValidPH4Voltage(float mv);

private:
  fs::FS* _fs = nullptr;
  String  _path;
  bool    _makeDirs = true;
  char    _err[64] = {0};

  void setError_(const char* msg);
  String tmpPath_() const { return _path + ".tmp"; }
  bool readFile_(const String& path, PHCalibration& cal);
  bool parse_(const String& text, PHCalibration& cal);
  bool ensureParentDir_();
};

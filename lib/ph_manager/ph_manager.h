#ifndef PH_MANAGER_H
#define PH_MANAGER_H

#include <Arduino.h>
#include <math.h>
#include "ph_calibration_store.h"

/**
 * Conversión mV -> pH con calibración de 2 puntos persistida.
 *
 *   pH = slope * mV + intercept
 *
 * Sin calibrar la recta es identidad (slope=1, intercept=0). Calibrar por
 * puntos la hace pasar por (V7, 7.0) y (V4, 4.0). Cada cambio reemplaza el
 * registro completo y se guarda en el store antes de aplicarse.
 */
class PHManager {
public:
  enum class Status : uint8_t {
    OK,
    INVALID_INPUT,   // mV/temperatura no numérico
    OUT_OF_WINDOW,   // voltaje fuera de la ventana del buffer
    STORE_FAIL,      // no se pudo guardar
    NOT_READY        // begin() sin store
  };

  PHManager();

  // Carga la calibración (por defecto si falta o está corrupta).
  // Si el archivo no existe, guarda los valores por defecto.
  bool begin(PHCalibrationStore* store);

  // decimals >= 0 redondea el resultado
  bool readPH(float mv, float& ph, int8_t decimals = -1);

  // Compensación lineal de temperatura sobre el voltaje:
  //   mV' = mV / (1 + coefficient * (tempC - 25))
  bool readPHCompensated(float mv, float tempC, float& ph,
                         float coefficient = 0.01f, int8_t decimals = -1);

  // ===== Calibración =====
  // Elige el punto según la ventana del voltaje (pH 7 o pH 4)
  bool autoCalibrate(float mv);
  bool calibratePH7(float mv);
  bool calibratePH4(float mv);
  bool setCalibrationData(float V7, float V4);
  bool resetToDefault();

  // Recta ajustada externamente (se persiste igual que una calibración)
  bool setCalibrationCoeffs(float slope, float intercept);

  static bool isValidPH7Voltage(float mv) { return PHCalibrationStore::isValidPH7Voltage(mv); }
  static bool isValidPH4Voltage(float mv) { return PHCalibrationStore::isValidPH4Voltage(mv); }

  // Imprime V7/V4 activos por el log
  void logActiveVoltages() const;

  const PHCalibration& calibration() const { return cal_; }
  float lastPH()          const { return last_ph_; }
  float lastMillivolts()  const { return last_mv_; }
  Status lastStatus()     const { return status_; }
  const char* lastError() const { return last_error_; }

private:
  PHCalibrationStore* store_ = nullptr;
  PHCalibration cal_;

  float  last_ph_ = NAN;
  float  last_mv_ = NAN;
  Status status_ = Status::OK;
  char   last_error_[64] = {0};

  void setError_(Status st, const char* msg);
  void clearError_();

  // Ajusta la recta por los dos puntos y la confirma
  bool applyPoints_(float V7, float V4);
  // Guarda el registro y recién ahí lo activa
  bool commit_(const PHCalibration& next);

  static float round_(float v, int8_t decimals);
};

#endif // PH_MANAGER_H

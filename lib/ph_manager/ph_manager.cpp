#include "ph_manager.h"
#include <string.h>
#include "log_manager.h"

PHManager::PHManager() : cal_(PHCalibrationStore::defaults()) {}

bool PHManager::begin(PHCalibrationStore* store) {
  cal_ = PHCalibrationStore::defaults();
  if (!store) {
    setError_(Status::NOT_READY, "Store nulo");
    return false;
  }
  store_ = store;

  if (!store_->exists()) {
    logger.log("[PH] Sin calibracion guardada, se guardan valores por defecto");
    if (!store_->save(cal_)) {
      setError_(Status::STORE_FAIL, store_->lastError());
      logger.log(String("[PH] ERROR al guardar: ") + last_error_);
      logActiveVoltages();
      return false;
    }
  } else {
    // load() deja valores por defecto si el archivo está corrupto
    store_->load(cal_);
  }

  clearError_();
  logActiveVoltages();
  return true;
}

// ===== Helpers internos =====
void PHManager::setError_(Status st, const char* msg) {
  status_ = st;
  strncpy(last_error_, msg, sizeof(last_error_) - 1);
  last_error_[sizeof(last_error_) - 1] = '\0';
}

void PHManager::clearError_() {
  status_ = Status::OK;
  last_error_[0] = '\0';
}

float PHManager::round_(float v, int8_t decimals) {
  if (decimals < 0) return v;
  const float p = powf(10.0f, (float)decimals);
  return roundf(v * p) / p;
}

void PHManager::logActiveVoltages() const {
  logger.log(String("[PH] Voltaje neutro activo (pH 7): ") + String(cal_.V7, 2) + " mV");
  logger.log(String("[PH] Voltaje acido activo (pH 4):  ") + String(cal_.V4, 2) + " mV");
}

bool PHManager::applyPoints_(float V7, float V4) {
  PHCalibration next{};
  if (!PHCalibrationStore::fitTwoPoint(V7, V4, next)) {
    setError_(Status::INVALID_INPUT, "Calibracion invalida (V7~V4)");
    return false;
  }
  return commit_(next);
}

bool PHManager::commit_(const PHCalibration& next) {
  if (!store_) {
    setError_(Status::NOT_READY, "Store no inicializado");
    return false;
  }
  if (!store_->save(next)) {
    setError_(Status::STORE_FAIL, store_->lastError());
    logger.log(String("[PH] ERROR al guardar: ") + last_error_);
    return false;
  }
  cal_ = next;
  clearError_();
  return true;
}

// ===== Lectura =====
bool PHManager::readPH(float mv, float& ph, int8_t decimals) {
  if (!isfinite(mv)) {
    setError_(Status::INVALID_INPUT, "mV invalido");
    return false;
  }
  const float v = round_(cal_.slope * mv + cal_.intercept, decimals);
  last_mv_ = mv;
  last_ph_ = v;
  ph = v;
  clearError_();
  return true;
}

bool PHManager::readPHCompensated(float mv, float tempC, float& ph,
                                  float coefficient, int8_t decimals) {
  if (!isfinite(tempC) || !isfinite(coefficient)) {
    setError_(Status::INVALID_INPUT, "Temperatura invalida");
    return false;
  }
  const float k = 1.0f + coefficient * (tempC - 25.0f);
  if (fabsf(k) < 1e-6f) {
    setError_(Status::INVALID_INPUT, "Compensacion invalida (k~0)");
    return false;
  }
  return readPH(mv / k, ph, decimals);
}

// ===== Calibración =====
bool PHManager::autoCalibrate(float mv) {
  if (!isfinite(mv)) {
    setError_(Status::INVALID_INPUT, "mV invalido");
    return false;
  }
  if (isValidPH7Voltage(mv)) return calibratePH7(mv);
  if (isValidPH4Voltage(mv)) return calibratePH4(mv);

  setError_(Status::OUT_OF_WINDOW, "mV fuera de ventana");
  logger.log(String("[PH] Auto calibracion no aplica para ") + String(mv, 2) +
             " mV, use calibratePH7/calibratePH4");
  return false;
}

bool PHManager::calibratePH7(float mv) {
  if (!isfinite(mv)) {
    setError_(Status::INVALID_INPUT, "mV invalido");
    return false;
  }
  if (!isValidPH7Voltage(mv)) {
    setError_(Status::OUT_OF_WINDOW, "mV fuera de ventana pH 7");
    return false;
  }
  if (!applyPoints_(mv, cal_.V4)) return false;
  logger.log(String("[PH] Calibrado pH 7 a ") + String(mv, 2) + " mV");
  return true;
}

bool PHManager::calibratePH4(float mv) {
  if (!isfinite(mv)) {
    setError_(Status::INVALID_INPUT, "mV invalido");
    return false;
  }
  if (!isValidPH4Voltage(mv)) {
    setError_(Status::OUT_OF_WINDOW, "mV fuera de ventana pH 4");
    return false;
  }
  if (!applyPoints_(cal_.V7, mv)) return false;
  logger.log(String("[PH] Calibrado pH 4 a ") + String(mv, 2) + " mV");
  return true;
}

bool PHManager::setCalibrationData(float V7, float V4) {
  if (!isfinite(V7) || !isfinite(V4)) {
    setError_(Status::INVALID_INPUT, "mV invalido");
    return false;
  }
  if (!isValidPH7Voltage(V7) || !isValidPH4Voltage(V4)) {
    setError_(Status::OUT_OF_WINDOW, "V7/V4 fuera de ventana");
    return false;
  }
  if (!applyPoints_(V7, V4)) return false;
  logActiveVoltages();
  return true;
}

bool PHManager::resetToDefault() {
  if (!commit_(PHCalibrationStore::defaults())) return false;
  logger.log("[PH] Calibracion restablecida a valores por defecto");
  logActiveVoltages();
  return true;
}

bool PHManager::setCalibrationCoeffs(float slope, float intercept) {
  if (!PHCalibrationStore::isValidCoeffs(slope, intercept)) {
    setError_(Status::INVALID_INPUT, "Coeficientes invalidos");
    return false;
  }
  // V7/V4 se conservan para la próxima calibración por puntos
  PHCalibration next = cal_;
  next.slope = slope;
  next.intercept = intercept;
  if (!commit_(next)) return false;
  logger.log(String("[PH] Recta fijada: slope=") + String(slope, 6) +
             " intercept=" + String(intercept, 4));
  return true;
}

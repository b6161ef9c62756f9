#include "ph_calibration_store.h"
#include <ArduinoJson.h>
#include <math.h>
#include <string.h>
#include "log_manager.h"

constexpr float PHCalibrationStore::kPH7;
constexpr float PHCalibrationStore::kPH4;
constexpr float PHCalibrationStore::kDefaultV7;
constexpr float PHCalibrationStore::kDefaultV4;
constexpr float PHCalibrationStore::kV7Min;
constexpr float PHCalibrationStore::kV7Max;
constexpr float PHCalibrationStore::kV4Min;
constexpr float PHCalibrationStore::kV4Max;
constexpr uint16_t PHCalibrationStore::kVersion;

// ===== Modelo =====
// Sin calibrar: recta identidad, puntos nominales listos para autoCalibrate()
PHCalibration PHCalibrationStore::defaults() {
  PHCalibration cal{};
  cal.V7 = kDefaultV7;
  cal.V4 = kDefaultV4;
  cal.slope = 1.0f;
  cal.intercept = 0.0f;
  return cal;
}

bool PHCalibrationStore::isValidCoeffs(float slope, float intercept) {
  return isfinite(slope) && isfinite(intercept) && fabsf(slope) >= 1e-9f;
}

bool PHCalibrationStore::fitTwoPoint(float V7, float V4, PHCalibration& out) {
  if (!isfinite(V7) || !isfinite(V4)) return false;
  if (fabsf(V7 - V4) < 1e-6f) return false;

  out.V7 = V7;
  out.V4 = V4;
  out.slope = (kPH7 - kPH4) / (V7 - V4);
  out.intercept = kPH7 - out.slope * V7;
  return true;
}

bool PHCalibrationStore::isValidPH7Voltage(float mv) {
  return isfinite(mv) && mv > kV7Min && mv < kV7Max;
}

bool PHCalibrationStore::isValidPH4Voltage(float mv) {
  return isfinite(mv) && mv > kV4Min && mv < kV4Max;
}

// ===== Privados =====
void PHCalibrationStore::setError_(const char* msg) {
  strncpy(_err, msg, sizeof(_err) - 1);
  _err[sizeof(_err) - 1] = '\0';
}

bool PHCalibrationStore::parse_(const String& text, PHCalibration& cal) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    setError_("JSON invalido");
    return false;
  }

  JsonVariantConst v7 = doc["neutral_voltage"];
  JsonVariantConst v4 = doc["acid_voltage"];
  if (!v7.is<float>() || !v4.is<float>()) {
    setError_("Faltan voltajes de calibracion");
    return false;
  }

  const float V7 = v7.as<float>();
  const float V4 = v4.as<float>();
  if (!isValidPH7Voltage(V7)) {
    setError_("V7 fuera de ventana");
    return false;
  }
  if (!isValidPH4Voltage(V4)) {
    setError_("V4 fuera de ventana");
    return false;
  }

  JsonVariantConst slope = doc["slope"];
  JsonVariantConst intercept = doc["intercept"];
  if (slope.isNull() && intercept.isNull()) {
    // Archivo sin recta: se deriva de los dos puntos
    if (!fitTwoPoint(V7, V4, cal)) {
      setError_("Calibracion invalida (V7~V4)");
      return false;
    }
    return true;
  }
  if (!slope.is<float>() || !intercept.is<float>() ||
      !isValidCoeffs(slope.as<float>(), intercept.as<float>())) {
    setError_("Recta invalida (slope/intercept)");
    return false;
  }

  cal.V7 = V7;
  cal.V4 = V4;
  cal.slope = slope.as<float>();
  cal.intercept = intercept.as<float>();
  return true;
}

bool PHCalibrationStore::readFile_(const String& path, PHCalibration& cal) {
  File f = _fs->open(path, FILE_READ);
  if (!f) {
    setError_("No se pudo abrir el archivo");
    return false;
  }
  String content = f.readString();
  f.close();
  return parse_(content, cal);
}

// Crea cada nivel del directorio padre (LittleFS no tiene mkdir -p)
bool PHCalibrationStore::ensureParentDir_() {
  const int slash = _path.lastIndexOf('/');
  if (slash <= 0) return true;  // raíz

  const String dir = _path.substring(0, slash);
  if (_fs->exists(dir)) return true;

  if (!_makeDirs) {
    setError_("El directorio no existe (makeDirs=false)");
    return false;
  }

  int from = 1;
  while (from <= (int)dir.length()) {
    int next = dir.indexOf('/', from);
    if (next < 0) next = dir.length();
    const String part = dir.substring(0, next);
    if (!_fs->exists(part) && !_fs->mkdir(part)) {
      setError_("mkdir fallo");
      return false;
    }
    from = next + 1;
  }
  logger.log(String("[STORE] Directorio creado: ") + dir);
  return true;
}

// ===== API =====
bool PHCalibrationStore::begin(fs::FS& fs, const char* path, bool makeDirs) {
  _fs = &fs;
  _path = path ? path : "";
  _makeDirs = makeDirs;
  if (_path.length() == 0 || _path[0] != '/') {
    setError_("Ruta invalida (debe empezar con /)");
    return false;
  }
  _err[0] = '\0';
  return true;
}

bool PHCalibrationStore::exists() const {
  if (!_fs) return false;
  return _fs->exists(_path) || _fs->exists(tmpPath_());
}

bool PHCalibrationStore::remove() {
  if (!_fs) {
    setError_("Store sin FS");
    return false;
  }
  if (_fs->exists(tmpPath_())) _fs->remove(tmpPath_());
  if (_fs->exists(_path) && !_fs->remove(_path)) {
    setError_("No se pudo borrar el archivo");
    return false;
  }
  _err[0] = '\0';
  return true;
}

bool PHCalibrationStore::load(PHCalibration& cal) {
  cal = defaults();
  if (!_fs) {
    setError_("Store sin FS");
    return false;
  }

  // Si un save() quedó a medias solo existe el .tmp (ya completo)
  String src = _path;
  if (!_fs->exists(src)) {
    if (!_fs->exists(tmpPath_())) {
      setError_("Archivo no existe");
      return false;
    }
    src = tmpPath_();
  }

  logger.log(String("[STORE] Cargando calibracion desde ") + src);
  PHCalibration tmp{};
  if (!readFile_(src, tmp)) {
    logger.log(String("[STORE] Archivo corrupto (") + _err + "), se usan valores por defecto");
    return false;
  }

  cal = tmp;
  _err[0] = '\0';
  return true;
}

bool PHCalibrationStore::save(const PHCalibration& cal) {
  if (!_fs) {
    setError_("Store sin FS");
    return false;
  }
  if (!isValidPH7Voltage(cal.V7)) {
    setError_("V7 fuera de ventana");
    return false;
  }
  if (!isValidPH4Voltage(cal.V4)) {
    setError_("V4 fuera de ventana");
    return false;
  }
  if (!isValidCoeffs(cal.slope, cal.intercept)) {
    setError_("Recta invalida (slope/intercept)");
    return false;
  }
  if (!ensureParentDir_()) return false;

  JsonDocument doc;
  doc["neutral_voltage"] = cal.V7;
  doc["acid_voltage"]    = cal.V4;
  doc["slope"]           = cal.slope;
  doc["intercept"]       = cal.intercept;
  doc["version"]         = kVersion;

  logger.log(String("[STORE] Guardando calibracion en ") + _path);

  const String tmp = tmpPath_();
  File f = _fs->open(tmp, FILE_WRITE);
  if (!f) {
    setError_("No se pudo abrir archivo temporal");
    return false;
  }
  const size_t expected = measureJson(doc);
  size_t written = serializeJson(doc, f);
  f.close();

  // El buffer puede aceptar bytes que no llegan a flash: se mide el archivo
  if (written == expected) {
    File check = _fs->open(tmp, FILE_READ);
    written = check ? check.size() : 0;
    check.close();
  }

  // Escritura parcial (FS lleno): el archivo bueno no se toca
  if (written == 0 || written != expected) {
    _fs->remove(tmp);
    setError_("Escritura incompleta");
    return false;
  }

  // FAT (SD) no renombra sobre un archivo existente
  if (_fs->exists(_path) && !_fs->remove(_path)) {
    setError_("No se pudo reemplazar el archivo");
    return false;
  }
  if (!_fs->rename(tmp, _path)) {
    setError_("rename fallo");
    return false;
  }

  _err[0] = '\0';
  return true;
}

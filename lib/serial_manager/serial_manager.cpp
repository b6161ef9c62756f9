#include "serial_manager.h"
#include <string.h>
#include "log_manager.h"

namespace PhProto {

constexpr size_t SerialManager::kMaxLine;

SerialManager::SerialManager(Stream& inOut, PHManager& ph) : io_(inOut), ph_(ph) {}

void SerialManager::loop() {
  while (io_.available()) {
    char c = (char)io_.read();
    if (discarding_) {
      if (c == '\n') discarding_ = false;
      continue;
    }
    if (c == '\n') {
      String line = lineBuf_;
      lineBuf_ = "";
      if (line.length() > 0) {
        logger.log(String("[UART] RX: ") + line);
        io_.println(handleLine(line));
      }
    } else if (c != '\r') {
      lineBuf_ += c;
      if (lineBuf_.length() > kMaxLine) {
        lineBuf_ = "";
        discarding_ = true;
        logger.log("[UART] ERROR: BAD_ARGS (linea demasiado larga)");
        io_.println(errorReply_("BAD_ARGS"));
      }
    }
  }
}

String SerialManager::errorReply_(const char* code) {
  JsonDocument out;
  out["ok"] = false;
  out["error"] = code;
  String s;
  serializeJson(out, s);
  return s;
}

// ================== Procesamiento NDJSON ==================
String SerialManager::handleLine(const String& lineRaw) {
  String line = lineRaw;
  line.trim();
  int i = line.indexOf('{');
  if (i > 0) line.remove(0, i);
  if (line.length() == 0 || line[0] != '{') {
    logger.log("[UART] DESCARTE: linea sin JSON valido");
    return errorReply_("BAD_JSON");
  }

  JsonDocument in;
  DeserializationError err = deserializeJson(in, line);
  if (err) {
    logger.log(String("[UART] ERROR: BAD_JSON (") + err.c_str() + ")");
    return errorReply_("BAD_JSON");
  }

  const char* op = in["op"] | "";
  JsonObjectConst dataIn = in["data"].as<JsonObjectConst>();

  JsonDocument out;
  out["ok"] = true;
  JsonObject data = out["data"].to<JsonObject>();

  const char* code = nullptr;
  if (!strcmp(op, "read_ph")) {
    code = handleReadPh_(dataIn, data);
  } else if (!strcmp(op, "auto_calibrate") ||
             !strcmp(op, "calibrate_ph7") ||
             !strcmp(op, "calibrate_ph4")) {
    code = handleCalibrate_(op, dataIn, data);
  } else if (!strcmp(op, "set_calibration")) {
    code = handleSetCalibration_(dataIn, data);
  } else if (!strcmp(op, "set_coefficients")) {
    code = handleSetCoefficients_(dataIn, data);
  } else if (!strcmp(op, "reset_calibration")) {
    if (ph_.resetToDefault()) addCalibration_(data);
    else code = statusCode_();
  } else if (!strcmp(op, "get_calibration")) {
    addCalibration_(data);
  } else {
    logger.log(String("[UART] ERROR: BAD_OP (") + op + ")");
    return errorReply_("BAD_OP");
  }

  if (code) {
    logger.log(String("[UART] ") + op + " -> " + code);
    return errorReply_(code);
  }

  String s;
  serializeJson(out, s);
  return s;
}

const char* SerialManager::resolveMillivolts_(JsonObjectConst in, float& mv) {
  JsonVariantConst v = in["mv"];
  if (v.isNull()) {
    if (!readMv_ || !readMv_(mv)) return "ADC_FAIL";
    return nullptr;
  }
  if (!v.is<float>()) return "BAD_ARGS";
  mv = v.as<float>();
  return nullptr;
}

// --- read_ph ---
const char* SerialManager::handleReadPh_(JsonObjectConst in, JsonObject out) {
  float mv = NAN;
  const char* code = resolveMillivolts_(in, mv);
  if (code) return code;

  float ph = NAN;
  bool ok;
  JsonVariantConst t = in["tempC"];
  if (t.isNull()) {
    ok = ph_.readPH(mv, ph, 2);
  } else {
    float tempC = NAN;
    if (t.is<const char*>() && !strcmp(t.as<const char*>(), "probe")) {
      if (!readTemp_ || !readTemp_(tempC)) return "TEMP_FAIL";
    } else if (t.is<float>()) {
      tempC = t.as<float>();
    } else {
      return "BAD_ARGS";
    }
    JsonVariantConst k = in["coefficient"];
    if (!k.isNull() && !k.is<float>()) return "BAD_ARGS";
    const float coefficient = k.isNull() ? 0.01f : k.as<float>();

    ok = ph_.readPHCompensated(mv, tempC, ph, coefficient, 2);
    out["tempC"] = tempC;
  }
  if (!ok) return statusCode_();

  out["mv"] = mv;
  out["ph"] = ph;
  return nullptr;
}

// --- auto_calibrate / calibrate_ph7 / calibrate_ph4 ---
const char* SerialManager::handleCalibrate_(const char* op, JsonObjectConst in, JsonObject out) {
  float mv = NAN;
  const char* code = resolveMillivolts_(in, mv);
  if (code) return code;

  bool ok;
  if (!strcmp(op, "calibrate_ph7"))      ok = ph_.calibratePH7(mv);
  else if (!strcmp(op, "calibrate_ph4")) ok = ph_.calibratePH4(mv);
  else                                   ok = ph_.autoCalibrate(mv);
  if (!ok) return statusCode_();

  addCalibration_(out);
  return nullptr;
}

// --- set_calibration ---
const char* SerialManager::handleSetCalibration_(JsonObjectConst in, JsonObject out) {
  JsonVariantConst v7 = in["neutral_voltage"];
  JsonVariantConst v4 = in["acid_voltage"];
  if (!v7.is<float>() || !v4.is<float>()) return "BAD_ARGS";

  if (!ph_.setCalibrationData(v7.as<float>(), v4.as<float>())) return statusCode_();
  addCalibration_(out);
  return nullptr;
}

// --- set_coefficients ---
const char* SerialManager::handleSetCoefficients_(JsonObjectConst in, JsonObject out) {
  JsonVariantConst slope = in["slope"];
  JsonVariantConst intercept = in["intercept"];
  if (!slope.is<float>() || !intercept.is<float>()) return "BAD_ARGS";

  if (!ph_.setCalibrationCoeffs(slope.as<float>(), intercept.as<float>())) return statusCode_();
  addCalibration_(out);
  return nullptr;
}

void SerialManager::addCalibration_(JsonObject out) const {
  const PHCalibration& cal = ph_.calibration();
  out["neutral_voltage"] = cal.V7;
  out["acid_voltage"]    = cal.V4;
  out["slope"]           = cal.slope;
  out["intercept"]       = cal.intercept;
}

const char* SerialManager::statusCode_() const {
  switch (ph_.lastStatus()) {
    case PHManager::Status::INVALID_INPUT: return "BAD_ARGS";
    case PHManager::Status::OUT_OF_WINDOW: return "OUT_OF_WINDOW";
    case PHManager::Status::STORE_FAIL:    return "STORE_FAIL";
    case PHManager::Status::NOT_READY:     return "NOT_READY";
    default:                               return "ERROR";
  }
}

} // namespace PhProto

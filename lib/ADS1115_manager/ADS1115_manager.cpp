#include "ADS1115_manager.h"
#include <cstring> // strncpy
#include "log_manager.h"

constexpr uint8_t ADS1115Manager::MAX_SAMPLES;

ADS1115Manager::ADS1115Manager(uint8_t i2c_addr, TwoWire* wire)
: addr_(i2c_addr), wire_(wire) {}

bool ADS1115Manager::begin() {
  connected_ = ads_.begin(addr_, wire_);
  if (!connected_) {
    setError_("ADS1115 no responde");
    logger.log(String("[ADS] ") + last_error_ + " (0x" + String(addr_, HEX) + ")");
    return false;
  }
  ads_.setGain(gain_);
  ads_.setDataRate(rate_);
  last_error_[0] = '\0';
  logger.log("[ADS] ADS1115 listo");
  return true;
}

void ADS1115Manager::setGain(adsGain_t g) {
  gain_ = g;
  if (connected_) ads_.setGain(gain_);
}

void ADS1115Manager::setDataRate(uint16_t r) {
  rate_ = r;
  if (connected_) ads_.setDataRate(rate_);
}

void ADS1115Manager::setAveraging(uint8_t n) {
  if (n < 5) n = 5;
  if (n > MAX_SAMPLES) n = MAX_SAMPLES;
  avg_ = n;
}

void ADS1115Manager::setCalibration(float scale, float offset) {
  cal_scale_     = scale;
  cal_offset_mv_ = offset;
}

bool ADS1115Manager::checkChannel_(uint8_t ch) {
  if (ch > 3) {
    setError_("Canal invalido (0..3)");
    return false;
  }
  if (!connected_) {
    setError_("ADS1115 no inicializado");
    return false;
  }
  return true;
}

void ADS1115Manager::setError_(const char* msg) {
  strncpy(last_error_, msg, sizeof(last_error_) - 1);
  last_error_[sizeof(last_error_) - 1] = '\0';
}

// Tiempo de conversión según data rate (SPS)
uint16_t ADS1115Manager::conversionDelayMs_() const {
  switch (rate_) {
    case RATE_ADS1115_8SPS:   return 140;
    case RATE_ADS1115_16SPS:  return 75;
    case RATE_ADS1115_32SPS:  return 40;
    case RATE_ADS1115_64SPS:  return 20;
    case RATE_ADS1115_250SPS: return 5;
    case RATE_ADS1115_475SPS: return 3;
    case RATE_ADS1115_860SPS: return 2;
    default:                  return 10;
  }
}

bool ADS1115Manager::robustAverage(int16_t* buf, uint8_t n, int16_t gate, int16_t& out) {
  if (!buf || n == 0) return false;

  // insertion sort
  for (uint8_t i = 1; i < n; ++i) {
    int16_t x = buf[i];
    int16_t j = (int16_t)i - 1;
    while (j >= 0 && buf[j] > x) { buf[j + 1] = buf[j]; --j; }
    buf[j + 1] = x;
  }

  int32_t med;
  if (n & 1) med = buf[n / 2];
  else       med = ((int32_t)buf[n / 2 - 1] + (int32_t)buf[n / 2]) / 2;

  int32_t acc = 0;
  uint16_t cnt = 0;
  for (uint8_t i = 0; i < n; ++i) {
    int32_t d = (int32_t)buf[i] - med;
    if (d < 0) d = -d;
    if (d <= gate) { acc += buf[i]; ++cnt; }
  }

  // Muy dispersas: media recortada 25% por lado
  if (cnt < (n / 2) || cnt == 0) {
    uint8_t k = n / 4;
    uint8_t start = k;
    uint8_t end = n - k;
    if (end <= start) { start = 0; end = n; }

    acc = 0; cnt = 0;
    for (uint8_t i = start; i < end; ++i) { acc += buf[i]; ++cnt; }
  }

  out = (int16_t)(acc / (int32_t)cnt);
  return true;
}

bool ADS1115Manager::readRaw(uint8_t channel, int16_t& raw) {
  if (!checkChannel_(channel)) return false;

  // Lectura descartada tras cambiar el MUX
  (void)ads_.readADC_SingleEnded(channel);
  const uint16_t waitMs = conversionDelayMs_();
  delay(waitMs);

  int16_t buf[MAX_SAMPLES];
  for (uint8_t i = 0; i < avg_; ++i) {
    buf[i] = ads_.readADC_SingleEnded(channel);
    if (i + 1 < avg_) delay(waitMs);
  }

  int16_t value;
  if (!robustAverage(buf, avg_, gate_, value)) {
    setError_("Sin muestras");
    return false;
  }

  last_raw_ = value;
  raw = value;
  last_error_[0] = '\0';
  return true;
}

bool ADS1115Manager::readMillivolts(uint8_t channel, float& mv) {
  int16_t raw;
  if (!readRaw(channel, raw)) return false;

  const float v = ads_.computeVolts(raw) * 1000.0f;
  last_mv_ = cal_scale_ * v + cal_offset_mv_;
  mv = last_mv_;
  return true;
}

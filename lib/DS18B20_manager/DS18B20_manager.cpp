#include "DS18B20_manager.h"
#include "log_manager.h"

constexpr uint8_t DS18B20Manager::MAX_SENSORS;

DS18B20Manager::DS18B20Manager(uint8_t dataPin, uint8_t resolutionBits)
: _resolution(constrain(resolutionBits, 9, 12)),
  _ow(dataPin),
  _dt(&_ow) {
}

uint8_t DS18B20Manager::begin() {
  _dt.begin();
  _dt.setWaitForConversion(true);
  _count = _dt.getDS18Count();
  if (_count > MAX_SENSORS) _count = MAX_SENSORS;

  for (uint8_t i = 0; i < _count; ++i) {
    if (!_dt.getAddress(_addr[i], i)) {
      _count = i;
      break;
    }
  }

  if (_count == 0) {
    logger.log("[TEMP] Sin sonda DS18B20, lecturas sin compensacion");
    return 0;
  }
  _dt.setResolution(_resolution);
  logger.log(String("[TEMP] DS18B20 listo (") + _count + " sonda/s)");
  return _count;
}

float DS18B20Manager::_norm(float c) const {
  if (c <= DEVICE_DISCONNECTED_C + 0.001f) return NAN;
  return c;
}

float DS18B20Manager::readC(uint8_t index) {
  if (index >= _count) return NAN;
  _dt.requestTemperaturesByAddress(_addr[index]);
  return _norm(_dt.getTempC(_addr[index]));
}

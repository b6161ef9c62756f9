#ifndef ADS1115_MANAGER_H
#define ADS1115_MANAGER_H

#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_ADS1X15.h>

/**
 * Entrada de la sonda de pH por ADS1115 (single-ended, A0..A3).
 * Entrega milivoltios filtrados: mediana + banda alrededor de la mediana,
 * con media recortada 25% como respaldo.
 */
class ADS1115Manager {
public:
  static constexpr uint8_t MAX_SAMPLES = 32;

  explicit ADS1115Manager(uint8_t i2c_addr = 0x48, TwoWire* wire = &Wire);

  bool begin();
  bool isConnected() const { return connected_; }

  void setGain(adsGain_t g);
  adsGain_t gain() const { return gain_; }

  void setDataRate(uint16_t r);
  uint16_t dataRate() const { return rate_; }

  void setAveraging(uint8_t n);                   // 5..32 muestras efectivas
  void setCalibration(float scale, float offset); // mV_out = scale * mV + offset (offset en mV)
  void setGateCounts(int16_t counts) { gate_ = counts; }

  bool readMillivolts(uint8_t channel, float& mv);
  bool readRaw(uint8_t channel, int16_t& raw);

  // Ordena buf[0..n) y devuelve el promedio robusto en out.
  // No depende del hardware.
  static bool robustAverage(int16_t* buf, uint8_t n, int16_t gate, int16_t& out);

  float lastMillivolts() const { return last_mv_; }
  int16_t lastRaw() const { return last_raw_; }
  const char* lastError() const { return last_error_; }

private:
  Adafruit_ADS1115 ads_;
  uint8_t addr_;
  TwoWire* wire_;
  bool connected_ = false;

  uint8_t avg_ = 8;
  float cal_scale_ = 1.0f;
  float cal_offset_mv_ = 0.0f;
  // ~0.1 V a PGA ±4.096 V (0.125 mV/cuenta)
  int16_t gate_ = 800;

  adsGain_t gain_ = GAIN_ONE;
  uint16_t  rate_ = RATE_ADS1115_128SPS;

  float   last_mv_ = NAN;
  int16_t last_raw_ = 0;
  char    last_error_[64] = {0};

  bool checkChannel_(uint8_t ch);
  void setError_(const char* msg);
  uint16_t conversionDelayMs_() const;
};

#endif // ADS1115_MANAGER_H

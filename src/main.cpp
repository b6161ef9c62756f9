#include <Arduino.h>
#include <LittleFS.h>
#include <Wire.h>
#include <globals.h>
#include "ph_calibration_store.h"
#include "ph_manager.h"
#include "serial_manager.h"

PHCalibrationStore phStore;
PHManager ph;
PhProto::SerialManager console(Serial2, ph);

void initFS();
void initADC();
void initThermo();
void initPH();

static bool readProbeMillivolts(float& mv);
static bool readProbeTemperature(float& tempC);

void setup() {
  Serial.begin(SERIAL_BAUD);
  Serial2.begin(UART_BAUD, SERIAL_8N1, UART_RX_PIN, UART_TX_PIN);
  logger.begin(Serial);
  delay(200);

  initFS();
  initADC();
  initThermo();
  initPH();

  console.setMillivoltSource(readProbeMillivolts);
  console.setTemperatureSource(readProbeTemperature);
  logger.log("[MAIN] Listo. Comandos NDJSON por Serial2, ej: {\"op\":\"read_ph\"}");
}

void loop() {
  console.loop();
  delay(10);
}

void initFS() {
  // true: formatea si la partición no monta (primer arranque)
  if (!LittleFS.begin(true)) {
    logger.log("[FS] ❌ Fallo al montar LittleFS, la calibracion no se guardara");
    return;
  }
  logger.log("[FS] ✅ LittleFS montado");
}

void initADC() {
  Wire.begin(I2C_SDA, I2C_SCL);
  ads.setAveraging(PH_AVG_SAMPLES);
  ads.begin();
}

void initThermo() {
  thermo.begin();
}

void initPH() {
  if (!phStore.begin(LittleFS, PH_CAL_FILE, /*makeDirs=*/true)) {
    logger.log(String("[STORE] ") + phStore.lastError());
  }
  if (!ph.begin(&phStore)) {
    logger.log(String("[PH] ") + ph.lastError() + ", se trabaja con valores por defecto");
  }
}

static bool readProbeMillivolts(float& mv) {
  if (!ads.readMillivolts(PH_ADS_CHANNEL, mv)) {
    logger.log(String("[ADS] ") + ads.lastError());
    return false;
  }
  return true;
}

static bool readProbeTemperature(float& tempC) {
  tempC = thermo.readC(0);
  if (isnan(tempC)) {
    logger.log("[TEMP] Lectura invalida del DS18B20");
    return false;
  }
  return true;
}

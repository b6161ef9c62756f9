#ifndef GLOBALS_H
#define GLOBALS_H
#include "log_manager.h"
#include "ADS1115_manager.h"
#include "DS18B20_manager.h"

#define SERIAL_BAUD 115200

// Consola NDJSON por UART2 (Serial queda para el log)
#define UART_RX_PIN 16
#define UART_TX_PIN 17
#define UART_BAUD 115200

// Bus I2C del ADS1115
#define I2C_SDA 21
#define I2C_SCL 22
#define ADS_I2C_ADDR 0x48

#define PH_ADS_CHANNEL 0
#define PH_AVG_SAMPLES 8

#define TEMP_SENSOR 19

#define PH_CAL_FILE "/ph/ph_calibration_data.json"

// Declaración, no creación
extern ADS1115Manager ads;
extern DS18B20Manager thermo;

#endif

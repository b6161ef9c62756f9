#include <Arduino.h>
#include <globals.h>

// Definición única de los objetos globales
ADS1115Manager ads(ADS_I2C_ADDR);
DS18B20Manager thermo(TEMP_SENSOR, 12);

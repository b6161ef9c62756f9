#include <Arduino.h>
#include <LittleFS.h>
#include <string.h>
#include <unity.h>

#include "ph_calibration_store.h"

static const char* kPath       = "/test_store/ph_cal.json";
static const char* kRootPath   = "/ph_cal_root.json";
static const char* kNestedPath = "/a/b/ph_cal.json";

PHCalibrationStore store;

static void writeRaw(const char* path, const char* text) {
    File f = LittleFS.open(path, FILE_WRITE);
    f.print(text);
    f.close();
}

static void assertDefaults(const PHCalibration& cal) {
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, PHCalibrationStore::kDefaultV7, cal.V7);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, PHCalibrationStore::kDefaultV4, cal.V4);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, cal.slope);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, cal.intercept);
}

// Ocupa el FS con un archivo de relleno hasta que una escritura queda corta
static const char* kFillerPath = "/filler.bin";

static void fillFilesystem() {
    uint8_t chunk[1024];
    memset(chunk, 0xAA, sizeof(chunk));
    File f = LittleFS.open(kFillerPath, FILE_WRITE);
    for (int i = 0; i < 4096; ++i) {
        if (f.write(chunk, sizeof(chunk)) < sizeof(chunk)) break;
    }
    f.close();
}

void setUp() {
    store.begin(LittleFS, kPath);
    store.remove();
    LittleFS.remove(kRootPath);
    LittleFS.remove(kNestedPath);
    LittleFS.rmdir("/a/b");
    LittleFS.rmdir("/a");
    LittleFS.remove(String(kRootPath) + ".tmp");
    LittleFS.remove(kFillerPath);
}

void tearDown() { }

// --- Defaults: recta identidad, puntos nominales 1500 / 2032.44 mV ---
void test_defaults_are_identity_line() {
    PHCalibration cal = PHCalibrationStore::defaults();
    assertDefaults(cal);
    TEST_ASSERT_EQUAL_FLOAT(7.0f, cal.slope * 7.0f + cal.intercept);
}

void test_coeffs_validation() {
    TEST_ASSERT_TRUE(PHCalibrationStore::isValidCoeffs(1.0f, 0.0f));
    TEST_ASSERT_TRUE(PHCalibrationStore::isValidCoeffs(-0.0056f, 15.45f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidCoeffs(0.0f, 7.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidCoeffs(NAN, 0.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidCoeffs(1.0f, INFINITY));
}

void test_fit_rejects_equal_voltages() {
    PHCalibration cal{};
    TEST_ASSERT_FALSE(PHCalibrationStore::fitTwoPoint(1500.0f, 1500.0f, cal));
    TEST_ASSERT_FALSE(PHCalibrationStore::fitTwoPoint(NAN, 2000.0f, cal));
}

void test_voltage_windows_are_open_intervals() {
    TEST_ASSERT_TRUE(PHCalibrationStore::isValidPH7Voltage(1500.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidPH7Voltage(1322.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidPH7Voltage(1678.0f));
    TEST_ASSERT_TRUE(PHCalibrationStore::isValidPH4Voltage(2000.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidPH4Voltage(1854.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidPH4Voltage(2210.0f));
    TEST_ASSERT_FALSE(PHCalibrationStore::isValidPH4Voltage(NAN));
}

// --- Archivo ausente -> defaults, no fatal ---
void test_load_missing_file_returns_defaults() {
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.exists());
    TEST_ASSERT_FALSE(store.load(cal));
    assertDefaults(cal);
}

// --- save() seguido de load() devuelve el mismo registro ---
void test_save_then_load_round_trip() {
    PHCalibration saved{};
    TEST_ASSERT_TRUE(PHCalibrationStore::fitTwoPoint(1515.0f, 2010.5f, saved));
    TEST_ASSERT_TRUE(store.save(saved));
    TEST_ASSERT_TRUE(store.exists());

    PHCalibration loaded{};
    TEST_ASSERT_TRUE(store.load(loaded));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, saved.V7, loaded.V7);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, saved.V4, loaded.V4);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, saved.slope, loaded.slope);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, saved.intercept, loaded.intercept);
}

// --- La recta guardada es la que se carga, no se recalcula de V7/V4 ---
void test_defaults_round_trip_keeps_identity() {
    TEST_ASSERT_TRUE(store.save(PHCalibrationStore::defaults()));
    PHCalibration loaded{};
    TEST_ASSERT_TRUE(store.load(loaded));
    assertDefaults(loaded);
}

void test_custom_coefficients_round_trip() {
    PHCalibration saved = PHCalibrationStore::defaults();
    saved.slope = 0.5f;
    saved.intercept = 3.25f;
    TEST_ASSERT_TRUE(store.save(saved));

    PHCalibration loaded{};
    TEST_ASSERT_TRUE(store.load(loaded));
    TEST_ASSERT_EQUAL_FLOAT(0.5f, loaded.slope);
    TEST_ASSERT_EQUAL_FLOAT(3.25f, loaded.intercept);
}

// --- Archivo sin slope/intercept: la recta sale de los puntos ---
void test_load_without_coefficients_fits_points() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{\"neutral_voltage\":1500.0,\"acid_voltage\":2000.0}");
    PHCalibration cal{};
    TEST_ASSERT_TRUE(store.load(cal));
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 7.0f, cal.slope * 1500.0f + cal.intercept);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 4.0f, cal.slope * 2000.0f + cal.intercept);
}

void test_load_zero_slope_falls_back_to_defaults() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{\"neutral_voltage\":1500.0,\"acid_voltage\":2000.0,"
                        "\"slope\":0,\"intercept\":7}");
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.load(cal));
    TEST_ASSERT_EQUAL_STRING("Recta invalida (slope/intercept)", store.lastError());
    assertDefaults(cal);
}

void test_save_overwrites_previous_record() {
    PHCalibration first{}, second{}, loaded{};
    PHCalibrationStore::fitTwoPoint(1450.0f, 2100.0f, first);
    PHCalibrationStore::fitTwoPoint(1550.0f, 1950.0f, second);
    TEST_ASSERT_TRUE(store.save(first));
    TEST_ASSERT_TRUE(store.save(second));
    TEST_ASSERT_TRUE(store.load(loaded));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1550.0f, loaded.V7);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1950.0f, loaded.V4);
    TEST_ASSERT_FALSE(LittleFS.exists(String(kPath) + ".tmp"));
}

// --- Archivo corrupto -> defaults ---
void test_load_corrupt_json_falls_back_to_defaults() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{neutral_voltage: 15");
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.load(cal));
    TEST_ASSERT_EQUAL_STRING("JSON invalido", store.lastError());
    assertDefaults(cal);
}

void test_load_missing_key_falls_back_to_defaults() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{\"neutral_voltage\":1510.0}");
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.load(cal));
    assertDefaults(cal);
}

void test_load_non_numeric_voltage_falls_back_to_defaults() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{\"neutral_voltage\":\"abc\",\"acid_voltage\":2000}");
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.load(cal));
    assertDefaults(cal);
}

void test_load_out_of_window_voltage_falls_back_to_defaults() {
    store.begin(LittleFS, kRootPath);
    writeRaw(kRootPath, "{\"neutral_voltage\":1800.0,\"acid_voltage\":2000.0}");
    PHCalibration cal{};
    TEST_ASSERT_FALSE(store.load(cal));
    TEST_ASSERT_EQUAL_STRING("V7 fuera de ventana", store.lastError());
    assertDefaults(cal);
}

// --- save() valida ventanas ---
void test_save_rejects_out_of_window_record() {
    PHCalibration cal = PHCalibrationStore::defaults();
    cal.V4 = 1700.0f;
    TEST_ASSERT_FALSE(store.save(cal));
    TEST_ASSERT_FALSE(store.exists());
}

// --- Directorio padre ---
void test_save_creates_nested_directory() {
    store.begin(LittleFS, kNestedPath, true);
    TEST_ASSERT_TRUE(store.save(PHCalibrationStore::defaults()));
    TEST_ASSERT_TRUE(LittleFS.exists(kNestedPath));
}

void test_save_without_makedirs_fails_on_missing_directory() {
    store.begin(LittleFS, kNestedPath, false);
    TEST_ASSERT_FALSE(store.save(PHCalibrationStore::defaults()));
    TEST_ASSERT_EQUAL_STRING("El directorio no existe (makeDirs=false)", store.lastError());
}

// --- Corte de energía entre remove() y rename(): solo queda el .tmp ---
void test_load_recovers_lone_tmp_file() {
    store.begin(LittleFS, kRootPath);
    const String tmp = String(kRootPath) + ".tmp";
    writeRaw(tmp.c_str(), "{\"neutral_voltage\":1520.0,\"acid_voltage\":1990.0,"
                          "\"slope\":-0.0063830,\"intercept\":16.702,\"version\":1}");
    TEST_ASSERT_FALSE(LittleFS.exists(kRootPath));
    TEST_ASSERT_TRUE(store.exists());

    PHCalibration cal{};
    TEST_ASSERT_TRUE(store.load(cal));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1520.0f, cal.V7);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1990.0f, cal.V4);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, -0.0063830f, cal.slope);
}

// --- FS lleno: escritura parcial no reemplaza el registro bueno ---
void test_short_write_keeps_previous_record() {
    PHCalibration first{};
    TEST_ASSERT_TRUE(PHCalibrationStore::fitTwoPoint(1515.0f, 2010.5f, first));
    TEST_ASSERT_TRUE(store.save(first));

    fillFilesystem();
    PHCalibration second{};
    PHCalibrationStore::fitTwoPoint(1450.0f, 2100.0f, second);
    const bool saved = store.save(second);
    LittleFS.remove(kFillerPath);

    TEST_ASSERT_FALSE(saved);
    TEST_ASSERT_FALSE(LittleFS.exists(String(kPath) + ".tmp"));

    PHCalibration loaded{};
    TEST_ASSERT_TRUE(store.load(loaded));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1515.0f, loaded.V7);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 2010.5f, loaded.V4);
}

void test_begin_rejects_relative_path() {
    PHCalibrationStore other;
    TEST_ASSERT_FALSE(other.begin(LittleFS, "ph_cal.json"));
}

void setup() {
    delay(2000);
    LittleFS.begin(true);
    UNITY_BEGIN();
    RUN_TEST(test_defaults_are_identity_line);
    RUN_TEST(test_coeffs_validation);
    RUN_TEST(test_fit_rejects_equal_voltages);
    RUN_TEST(test_voltage_windows_are_open_intervals);
    RUN_TEST(test_load_missing_file_returns_defaults);
    RUN_TEST(test_save_then_load_round_trip);
    RUN_TEST(test_defaults_round_trip_keeps_identity);
    RUN_TEST(test_custom_coefficients_round_trip);
    RUN_TEST(test_load_without_coefficients_fits_points);
    RUN_TEST(test_load_zero_slope_falls_back_to_defaults);
    RUN_TEST(test_save_overwrites_previous_record);
    RUN_TEST(test_load_corrupt_json_falls_back_to_defaults);
    RUN_TEST(test_load_missing_key_falls_back_to_defaults);
    RUN_TEST(test_load_non_numeric_voltage_falls_back_to_defaults);
    RUN_TEST(test_load_out_of_window_voltage_falls_back_to_defaults);
    RUN_TEST(test_save_rejects_out_of_window_record);
    RUN_TEST(test_save_creates_nested_directory);
    RUN_TEST(test_save_without_makedirs_fails_on_missing_directory);
    RUN_TEST(test_load_recovers_lone_tmp_file);
    RUN_TEST(test_short_write_keeps_previous_record);
    RUN_TEST(test_begin_rejects_relative_path);
    UNITY_END();
}

void loop() {
    // Not used
}

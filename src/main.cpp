#include <Arduino.h>

#include "app/App.h"
#include "app/HardwareConfig.h"

void setup() {
  Serial.begin(HwCfg::CONSOLE_BAUD);
  delay(200);

  App::begin();
}

void loop() {
  App::tick(millis());
}

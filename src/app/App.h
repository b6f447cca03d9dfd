#pragma once

#include <stdint.h>

namespace App {

void begin();
void tick(uint32_t nowMs);

} // namespace App

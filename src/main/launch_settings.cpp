#include "launch_settings.hpp"

#include <stdexcept>

void LaunchSettings::SetMode(ConversionMode value) {
  if (mode != ConversionMode::kAuto && mode != value) {
    throw std::runtime_error("numerals: cannot combine -e with -r");
  }
  mode = value;
}

#include "verbose.hpp"

namespace utils::verbose {

bool Flags::NeedToPrintVerbose() const { return need_to_print_verbose_; }

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::Clean() { need_to_print_verbose_ = false; }

} // namespace utils::verbose

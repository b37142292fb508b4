/**
* @file time_driver.cpp
* @brief TimeDriver static member definitions
*/

#include "kestrel/time_driver.hpp"

namespace kestrel
{

ITimeDriver* ITimeDriver::instance = nullptr;

} // namespace kestrel

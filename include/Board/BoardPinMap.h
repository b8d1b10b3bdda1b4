#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

#if BOARD_REV == 1
namespace Unit {
constexpr uint8_t U1 = 32;
constexpr uint8_t U2 = 33;
constexpr uint8_t U3 = 25;
constexpr uint8_t U4 = 26;
constexpr uint8_t U5 = 27;
constexpr uint8_t U6 = 14;
constexpr uint8_t U7 = 12;
constexpr uint8_t U8 = 13;
constexpr uint8_t U9 = 23;
constexpr uint8_t U10 = 22;
constexpr uint8_t U11 = 21;
}  // namespace Unit

namespace Switch {
constexpr uint8_t M1 = 34;
constexpr uint8_t M2 = 35;
constexpr uint8_t M3 = 39;
}  // namespace Switch

namespace Flow {
constexpr uint8_t Meter0 = 36;
constexpr uint8_t Meter1 = 19;
}  // namespace Flow

namespace DO {
constexpr uint8_t Buzzer = 18;
}  // namespace DO
#else
#error "Unsupported BOARD_REV value"
#endif

}  // namespace Board

/**
 * @file GpioHardwareIO.cpp
 * @brief Implementation file.
 */

#include "GpioHardwareIO.h"
#include <Arduino.h>

GpioHardwareIO* GpioHardwareIO::instance_ = nullptr;

static int offLevel_(const UnitOutDef& def) { return def.activeHigh ? LOW : HIGH; }

bool GpioHardwareIO::begin()
{
    if (instance_ && instance_ != this) return false;
    instance_ = this;

    /// sorties à l'état repos avant tout démarrage de tâche
    for (uint8_t i = 0; i < BoardLayout::UnitCount; ++i) {
        const UnitOutDef& def = BoardLayout::Units[i];
        digitalWrite(def.pin, offLevel_(def));
        pinMode(def.pin, OUTPUT);
        digitalWrite(def.pin, offLevel_(def));
    }
    digitalWrite(BoardLayout::Buzzer.pin, offLevel_(BoardLayout::Buzzer));
    pinMode(BoardLayout::Buzzer.pin, OUTPUT);
    digitalWrite(BoardLayout::Buzzer.pin, offLevel_(BoardLayout::Buzzer));

    for (uint8_t i = 0; i < BoardLayout::SwitchCount; ++i) {
        pinMode(BoardLayout::Switches[i].pin, INPUT);
    }
    for (uint8_t i = 0; i < BoardLayout::FlowMeterCount; ++i) {
        pinMode(BoardLayout::FlowMeters[i].pin, INPUT);
    }

    begun_ = true;
    return true;
}

bool GpioHardwareIO::attachInputs(SwitchEdgeCallback onEdge, void* ctx)
{
    if (!begun_ || !onEdge) return false;
    edgeCtx_ = ctx;
    onEdge_ = onEdge;

    attachInterrupt(digitalPinToInterrupt(BoardLayout::Switches[0].pin), isrSwitch1_, FALLING);
    attachInterrupt(digitalPinToInterrupt(BoardLayout::Switches[1].pin), isrSwitch2_, FALLING);
    attachInterrupt(digitalPinToInterrupt(BoardLayout::Switches[2].pin), isrSwitch3_, FALLING);
    attachInterrupt(digitalPinToInterrupt(BoardLayout::FlowMeters[0].pin), isrFlow0_, FALLING);
    attachInterrupt(digitalPinToInterrupt(BoardLayout::FlowMeters[1].pin), isrFlow1_, FALLING);
    return true;
}

const UnitOutDef* GpioHardwareIO::unitDef_(uint8_t unitId)
{
    for (uint8_t i = 0; i < BoardLayout::UnitCount; ++i) {
        if (BoardLayout::Units[i].unitId == unitId) return &BoardLayout::Units[i];
    }
    return nullptr;
}

bool GpioHardwareIO::writeVerified_(const UnitOutDef& def, bool on)
{
    const bool level = on ? def.activeHigh : !def.activeHigh;
    digitalWrite(def.pin, level ? HIGH : LOW);
    /// relecture du latch de sortie
    return (digitalRead(def.pin) == HIGH) == level;
}

bool GpioHardwareIO::assertOutput(uint8_t unitId)
{
    const UnitOutDef* def = unitDef_(unitId);
    if (!begun_ || !def) return false;
    return writeVerified_(*def, true);
}

bool GpioHardwareIO::deassertOutput(uint8_t unitId)
{
    const UnitOutDef* def = unitDef_(unitId);
    if (!begun_ || !def) return false;
    return writeVerified_(*def, false);
}

bool GpioHardwareIO::driveBuzzer(bool on)
{
    if (!begun_) return false;
    return writeVerified_(BoardLayout::Buzzer, on);
}

uint32_t GpioHardwareIO::readAndResetPulses(uint8_t sourceId)
{
    if (sourceId >= Limits::Irrigation::MaxFlowSources) return 0;
    return flow_[sourceId].readAndReset();
}

void IRAM_ATTR GpioHardwareIO::onSwitch_(uint8_t switchId)
{
    GpioHardwareIO* self = instance_;
    if (!self || !self->onEdge_) return;
    self->onEdge_(self->edgeCtx_, switchId, (uint32_t)millis());
}

void IRAM_ATTR GpioHardwareIO::isrSwitch1_() { onSwitch_(1); }
void IRAM_ATTR GpioHardwareIO::isrSwitch2_() { onSwitch_(2); }
void IRAM_ATTR GpioHardwareIO::isrSwitch3_() { onSwitch_(3); }

void IRAM_ATTR GpioHardwareIO::isrFlow0_()
{
    if (instance_) instance_->flow_[0].increment();
}

void IRAM_ATTR GpioHardwareIO::isrFlow1_()
{
    if (instance_) instance_->flow_[1].increment();
}

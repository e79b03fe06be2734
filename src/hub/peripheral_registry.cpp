#include "hub/peripheral_registry.hpp"
#include "util/log.hpp"

namespace hub
{

namespace
{
template <typename T>
PeripheralFactory make()
{
    return [](Hub &hub, std::uint8_t port, std::uint16_t dev_type) {
        return std::make_shared<T>(hub, port, dev_type);
    };
}
}  // namespace

void PeripheralRegistry::add(std::uint16_t dev_type, PeripheralFactory factory)
{
    factories_[dev_type] = std::move(factory);
}

bool PeripheralRegistry::knows(std::uint16_t dev_type) const
{
    return factories_.count(dev_type) != 0;
}

std::shared_ptr<Peripheral> PeripheralRegistry::create(Hub          &hub,
                                                       std::uint8_t  port,
                                                       std::uint16_t dev_type) const
{
    std::shared_ptr<Peripheral> p;
    auto                        it = factories_.find(dev_type);
    if (it == factories_.end() || !it->second)
    {
        LOG_WARN("[ATTACH] no peripheral class for device type 0x%04x on port 0x%02x, using generic",
                 (unsigned)dev_type, (unsigned)port);
        p = std::make_shared<Peripheral>(hub, port, dev_type);
    }
    else
    {
        p = it->second(hub, port, dev_type);
    }
    if (p)
        p->start();
    return p;
}

PeripheralRegistry PeripheralRegistry::defaults()
{
    PeripheralRegistry r;
    r.add(proto::dev::MOTOR, make<Motor>());
    r.add(proto::dev::MOTOR_EXTERNAL_TACHO, make<EncodedMotor>());
    r.add(proto::dev::MOTOR_INTERNAL_TACHO, make<EncodedMotor>());
    r.add(proto::dev::VISION_SENSOR, make<VisionSensor>());
    r.add(proto::dev::RGB_LIGHT, make<RgbLight>());
    r.add(proto::dev::TILT_EXTERNAL, make<TiltSensor>());
    r.add(proto::dev::TILT_INTERNAL, make<TiltSensor>());
    r.add(proto::dev::CURRENT, make<CurrentSensor>());
    r.add(proto::dev::VOLTAGE, make<VoltageSensor>());
    return r;
}

}  // namespace hub

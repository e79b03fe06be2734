#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "hub/peripheral.hpp"

namespace hub
{

using PeripheralFactory =
    std::function<std::shared_ptr<Peripheral>(Hub &hub, std::uint8_t port, std::uint16_t dev_type)>;

// Device type code -> constructor. Unknown codes build a generic Peripheral.
class PeripheralRegistry
{
  public:
    // Adds or replaces the factory for a device type.
    void add(std::uint16_t dev_type, PeripheralFactory factory);
    bool knows(std::uint16_t dev_type) const;

    std::shared_ptr<Peripheral> create(Hub &hub, std::uint8_t port, std::uint16_t dev_type) const;

    static PeripheralRegistry defaults();

  private:
    std::map<std::uint16_t, PeripheralFactory> factories_;
};

}  // namespace hub

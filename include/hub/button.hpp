#pragma once
#include <functional>
#include <mutex>
#include <vector>

#include "proto/messages.hpp"

namespace hub
{

class Hub;

// The hub's own push button. Not a port peripheral: it is reported through
// hub property updates.
class Button
{
  public:
    using OnButton = std::function<void(bool pressed)>;

    explicit Button(Hub &hub) : hub_(hub) {}

    // The first subscriber enables button updates on the hub.
    bool subscribe(OnButton cb);
    // Drops all subscribers and disables updates.
    bool unsubscribe();

    bool pressed() const;
    bool subscribed() const;

    // Fed with every hub properties notification; ignores other properties.
    void handle_property(const proto::HubPropertiesMsg &msg);

  private:
    Hub &hub_;

    mutable std::mutex    mu_;
    std::vector<OnButton> subscribers_;
    bool                  pressed_{false};
};

}  // namespace hub

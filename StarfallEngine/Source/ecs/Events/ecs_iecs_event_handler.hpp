#pragma once
#include "GameEventBlob.hpp"

class IEventHandler {
public:
    virtual ~IEventHandler() = default;
    virtual void Handle(const GameEventBlob& event) = 0;
};

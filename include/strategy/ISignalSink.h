#pragma once

#include "common/Types.h"

namespace triplersi {
namespace strategy {

// 확정된 신호 수신자 (엔진)
class ISignalSink {
public:
    virtual ~ISignalSink() = default;
    virtual void onSignal(const Signal& signal) = 0;
};

} // namespace strategy
} // namespace triplersi

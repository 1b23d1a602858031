#include "backtest/position.hpp"

std::string directionToString(Direction direction) {
    switch (direction) {
    case Direction::Flat:
        return "FLAT";
    case Direction::Long:
        return "LONG";
    case Direction::Short:
        return "SHORT";
    }
    return "UNKNOWN";
}

std::string exitReasonToString(ExitReason reason) {
    switch (reason) {
    case ExitReason::Signal:
        return "SIGNAL";
    case ExitReason::StopLoss:
        return "STOP_LOSS";
    case ExitReason::EndOfData:
        return "END_OF_DATA";
    }
    return "UNKNOWN";
}

#include "strategy/istrategy.hpp"

std::string actionToString(Action action) {
    switch (action) {
    case Action::None:
        return "NONE";
    case Action::EnterLong:
        return "ENTER_LONG";
    case Action::EnterShort:
        return "ENTER_SHORT";
    case Action::Close:
        return "CLOSE";
    }
    return "UNKNOWN";
}

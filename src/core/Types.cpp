#include "pathlayer/core/Types.h"

#include <stdexcept>

namespace pathlayer {

std::string connectivityToString(Connectivity connectivity) {
    switch (connectivity) {
        case Connectivity::Rook: return "rook";
        case Connectivity::Queen: return "queen";
    }
    return "queen";
}

Connectivity connectivityFromString(const std::string& name) {
    if (name == "rook") return Connectivity::Rook;
    if (name == "queen") return Connectivity::Queen;
    throw std::invalid_argument("Unknown grid connectivity: '" + name + "'");
}

}  // namespace pathlayer

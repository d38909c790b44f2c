#pragma once

#include <string>

namespace cirrus {

/**
 * @brief Everything needed to build and initialize a flight model.
 */
struct FdmConfig {
    std::string rootPath = ".";
    std::string modelName = "Rascal110-JSBSim";
    double dt = 1.0 / 60.0;

    double latitudeDeg = 37.9232547;
    double longitudeDeg = 23.7647994;
    double altitudeMeters = 300.0;
    double airspeedKnots = 80.0;
    double headingDeg = 45.0;
};

} // namespace cirrus

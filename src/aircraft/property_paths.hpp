#pragma once

namespace cirrus {
namespace Properties {

// JSBSim property tree paths used by the façade and the adapter.

namespace Controls {
    inline constexpr char AILERON[] = "fcs/aileron-cmd-norm";
    inline constexpr char ELEVATOR[] = "fcs/elevator-cmd-norm";
    inline constexpr char RUDDER[] = "fcs/rudder-cmd-norm";
    inline constexpr char THROTTLE[] = "fcs/throttle-cmd-norm";
}

namespace Engine {
    inline constexpr char SET_RUNNING[] = "propulsion/set-running";
    inline constexpr char THRUST_LBS[] = "propulsion/engine/thrust-lbs";
}

namespace Position {
    inline constexpr char ALTITUDE_M[] = "position/h-sl-meters";
}

namespace InitialConditions {
    inline constexpr char LATITUDE_DEG[] = "ic/lat-geod-deg";
    inline constexpr char LONGITUDE_DEG[] = "ic/long-gc-deg";
    inline constexpr char ALTITUDE_FT[] = "ic/h-sl-ft";
    inline constexpr char AIRSPEED_KTS[] = "ic/vc-kts";
    inline constexpr char HEADING_DEG[] = "ic/psi-true-deg";
}

} // namespace Properties
} // namespace cirrus

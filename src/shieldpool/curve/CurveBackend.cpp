#include "shieldpool/curve/CurveBackend.hpp"

#include "shieldpool/curve/LibsnarkCurve.hpp"
#include "shieldpool/curve/ReferenceCurve.hpp"

namespace libshieldpool {

std::vector<std::string> CurveBackendNames()
{
    return {DEFAULT_CURVE_BACKEND, "reference"};
}

std::unique_ptr<CurveBackend> MakeCurveBackend(const std::string& name)
{
    if (name == "libsnark") {
        return std::unique_ptr<CurveBackend>(new LibsnarkCurve());
    }
    if (name == "reference") {
        return std::unique_ptr<CurveBackend>(new ReferenceCurve());
    }
    throw std::invalid_argument("unknown curve backend: " + name);
}

}

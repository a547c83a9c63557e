#include <hostkit/rect.hpp>

#include <ostream>

namespace hostkit
{

std::string Rect::to_string() const
{
    return "[" + std::to_string(x) + ", " + std::to_string(y) + ", " + std::to_string(w) + ", "
           + std::to_string(h) + "]";
}

std::ostream& operator<<(std::ostream& os, const Rect& r)
{
    return os << r.to_string();
}

}   // namespace hostkit

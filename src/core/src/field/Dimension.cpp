#include "field/Dimension.hpp"

namespace gridflow::field
{

const char* to_string(DimensionKind k) noexcept
{
    switch (k)
    {
    case DimensionKind::Horizontal:
        return "horizontal";
    case DimensionKind::Vertical:
        return "vertical";
    case DimensionKind::Local:
        return "local";
    }
    return "?";
}

std::string to_string(const Dimension& d)
{
    if (d.kind() == DimensionKind::Horizontal)
        return d.name();
    return d.name() + "[" + to_string(d.kind()) + "]";
}

std::string to_string(std::span<const Dimension> dims)
{
    std::string s = "(";
    for (std::size_t i = 0; i < dims.size(); ++i)
    {
        if (i)
            s += ", ";
        s += to_string(dims[i]);
    }
    return s + ")";
}

std::ostream& operator<<(std::ostream& os, const Dimension& d)
{
    return os << to_string(d);
}

bool has_duplicates(std::span<const Dimension> dims)
{
    for (std::size_t i = 0; i < dims.size(); ++i)
        for (std::size_t j = i + 1; j < dims.size(); ++j)
            if (dims[i] == dims[j])
                return true;
    return false;
}

Dims merge_dims(std::span<const Dimension> a, std::span<const Dimension> b)
{
    Dims out(a.begin(), a.end());
    for (const auto& d : b)
        if (!contains(out, d))
            out.push_back(d);
    return out;
}

} // namespace gridflow::field

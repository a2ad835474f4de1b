#pragma once
#include "field/Dimension.hpp"
#include "field/Layout.hpp"
#include "master/Errors.hpp"
#include "memory/AlignedAlloc.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file Field.hpp
 * @brief Dimension-tagged, origin-shifted N-d array.
 *
 * @details
 * ``Field<T>`` is a view (dims, strided layout, per-axis origin, broadcast dims) onto a
 * shared, aligned storage block. External indices are **1-based** and shifted by the
 * axis origin: axis ``a`` exposes ``origin[a]+1 .. origin[a]+extent[a]``. Every access
 * goes through :cpp:func:`Field::storage_index`, the single place where external
 * indices are translated and bounds-checked.
 *
 * Views produced by ``slice``, ``broadcast_to`` and vertical shifts share storage with
 * their parent; gathers, reductions and arithmetic allocate fresh storage.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   const Dimension Cell{"Cell"}, K{"K", DimensionKind::Vertical};
 *   Field<double> f({Cell, K}, {3, 2}, {.origin = {{K, 1}}});   // K indices 2..3
 *   f.set({1, 2}, 4.0);
 *   double v = f.get({1, 2});
 *   auto row = f.slice({Sel::at(1), Sel::all()});               // Field over (K)
 * @endrst
 */

namespace gridflow::field
{

inline constexpr int kIndexBase = 1;

class FieldOffset;
struct NeighborSlot;

// Inclusive external index range of one axis
struct AxisRange
{
    int lo{kIndexBase};
    int hi{kIndexBase - 1};

    int size() const noexcept { return hi - lo + 1; }
    bool contains(int i) const noexcept { return i >= lo && i <= hi; }
    friend bool operator==(const AxisRange&, const AxisRange&) = default;
};

struct Shape
{
    Dims dims;
    std::vector<AxisRange> ranges;
    Dims broadcast_dims;
    friend bool operator==(const Shape&, const Shape&) = default;
};

using Origin = std::vector<std::pair<Dimension, int>>;

struct FieldOptions
{
    Dims broadcast_dims{}; // empty => same as dims
    Origin origin{};       // missing axes => 0; entries for foreign dims are ignored
};

// Per-axis selector for Field::slice
struct Sel
{
    int lo{0};
    int hi{0};
    bool keep{true};  // false => scalar index, axis dropped
    bool whole{false};

    static Sel at(int i) { return {i, i, false, false}; }
    static Sel range(int lo, int hi) { return {lo, hi, true, false}; }
    static Sel all() { return {0, 0, true, true}; }
};

template <class T> const char* element_type_name()
{
    if constexpr (std::is_same_v<T, bool>)
        return "Bool";
    else if constexpr (std::is_same_v<T, double>)
        return "Float64";
    else if constexpr (std::is_same_v<T, float>)
        return "Float32";
    else if constexpr (std::is_same_v<T, std::int64_t>)
        return "Int64";
    else if constexpr (std::is_same_v<T, std::int32_t>)
        return "Int32";
    else
        return "Number";
}

template <class T> class Field
{
    static_assert(std::is_arithmetic_v<T>, "Field element type must be arithmetic");

  public:
    using value_type = T;

    // rank-0 zero
    Field() : Field(Dims{}, std::vector<int>{}) {}

    // zero-filled
    Field(Dims dims, std::vector<int> extents, const FieldOptions& opt = {})
    {
        init(std::move(dims), std::move(extents), opt);
    }

    // values are first-axis-fastest
    Field(Dims dims, std::vector<int> extents, const std::vector<T>& values,
          const FieldOptions& opt = {})
    {
        init(std::move(dims), std::move(extents), opt);
        if (values.size() != layout_.volume())
            throw ShapeError("Field " + to_string(dims_) + ": expected " +
                             std::to_string(layout_.volume()) + " values, got " +
                             std::to_string(values.size()));
        T* p = buf_.get();
        for (std::size_t i = 0; i < values.size(); ++i)
            p[i] = values[i];
    }

    // A bare scalar promoted to a rank-0 Field.
    static Field scalar(T v, Dims broadcast_dims = {})
    {
        Field f(Dims{}, std::vector<int>{}, FieldOptions{std::move(broadcast_dims), {}});
        f.buf_.get()[0] = v;
        return f;
    }

    // ---- shape ----------------------------------------------------------------------
    std::size_t rank() const noexcept { return dims_.size(); }
    const Dims& dims() const noexcept { return dims_; }
    const Dims& broadcast_dims() const noexcept { return bdims_; }
    const std::vector<int>& origin() const noexcept { return origin_; }
    const std::vector<int>& extents() const noexcept { return layout_.extents; }
    std::size_t size() const noexcept { return layout_.volume(); }

    AxisRange range(std::size_t axis) const noexcept
    {
        const int lo = origin_[axis] + kIndexBase;
        return {lo, lo + layout_.extents[axis] - 1};
    }

    Shape shape() const
    {
        Shape s{dims_, {}, bdims_};
        for (std::size_t a = 0; a < rank(); ++a)
            s.ranges.push_back(range(a));
        return s;
    }

    // ---- element access ---------------------------------------------------------------
    // External (1-based, origin-shifted) index -> position in storage.
    std::ptrdiff_t storage_index(std::span<const int> ext) const
    {
        if (ext.size() != rank())
            throw IndexError("Field " + to_string(dims_) + ": expected " +
                             std::to_string(rank()) + " indices, got " +
                             std::to_string(ext.size()));
        std::ptrdiff_t p = layout_.offset;
        for (std::size_t a = 0; a < ext.size(); ++a)
        {
            const int local = ext[a] - origin_[a] - kIndexBase;
            if (local < 0 || local >= layout_.extents[a])
            {
                const auto r = range(a);
                throw IndexError("index " + std::to_string(ext[a]) + " out of range " +
                                 std::to_string(r.lo) + ":" + std::to_string(r.hi) +
                                 " on axis " + to_string(dims_[a]));
            }
            p += static_cast<std::ptrdiff_t>(local) * layout_.strides[a];
        }
        return p;
    }

    T get(std::span<const int> ext) const { return buf_.get()[storage_index(ext)]; }
    T get(std::initializer_list<int> ext) const
    {
        return get(std::span<const int>(ext.begin(), ext.size()));
    }
    void set(std::span<const int> ext, T v) { buf_.get()[storage_index(ext)] = v; }
    void set(std::initializer_list<int> ext, T v)
    {
        set(std::span<const int>(ext.begin(), ext.size()), v);
    }

    // Unchecked 0-based local access for kernels.
    inline T& local(std::span<const int> idx) noexcept { return buf_.get()[layout_(idx)]; }
    inline const T& local(std::span<const int> idx) const noexcept
    {
        return buf_.get()[layout_(idx)];
    }

    // ---- views ------------------------------------------------------------------------
    Field slice(std::span<const Sel> sel) const
    {
        if (sel.size() != rank())
            throw ShapeError("slice: expected " + std::to_string(rank()) + " selectors, got " +
                             std::to_string(sel.size()));
        Field out = *this;
        out.dims_.clear();
        out.origin_.clear();
        out.layout_.extents.clear();
        out.layout_.strides.clear();
        out.layout_.offset = layout_.offset;
        for (std::size_t a = 0; a < rank(); ++a)
        {
            const auto r = range(a);
            const int lo = sel[a].whole ? r.lo : sel[a].lo;
            const int hi = sel[a].whole ? r.hi : sel[a].hi;
            if (!r.contains(lo) || !r.contains(hi) || hi < lo)
                throw IndexError("slice " + std::to_string(lo) + ":" + std::to_string(hi) +
                                 " out of range " + std::to_string(r.lo) + ":" +
                                 std::to_string(r.hi) + " on axis " + to_string(dims_[a]));
            out.layout_.offset += static_cast<std::ptrdiff_t>(lo - r.lo) * layout_.strides[a];
            if (!sel[a].keep)
                continue;
            out.dims_.push_back(dims_[a]);
            out.origin_.push_back(0);
            out.layout_.extents.push_back(hi - lo + 1);
            out.layout_.strides.push_back(layout_.strides[a]);
        }
        return out;
    }
    Field slice(std::initializer_list<Sel> sel) const
    {
        return slice(std::span<const Sel>(sel.begin(), sel.size()));
    }

    Field broadcast_to(Dims new_broadcast_dims) const
    {
        if (!is_subset(dims_, new_broadcast_dims))
            throw ShapeError("broadcast_to: " + to_string(new_broadcast_dims) +
                             " is not a superset of " + to_string(dims_));
        Field out = *this;
        out.bdims_ = std::move(new_broadcast_dims);
        return out;
    }

    // Same data, origin of one axis replaced.
    Field with_origin(std::size_t axis, int new_origin) const
    {
        Field out = *this;
        out.origin_.at(axis) = new_origin;
        return out;
    }

    // Deep copy into fresh packed storage.
    Field copy() const { return astype<T>(); }

    template <class U> Field<U> astype() const
    {
        FieldOptions opt{bdims_, {}};
        for (std::size_t a = 0; a < rank(); ++a)
            opt.origin.emplace_back(dims_[a], origin_[a]);
        Field<U> out(dims_, layout_.extents, opt);
        if (size() == 0)
            return out;
        std::vector<int> idx(rank(), 0);
        do
            out.local(idx) = static_cast<U>(local(idx));
        while (layout::next_index(idx, layout_.extents));
        return out;
    }

    bool shares_storage_with(const Field& o) const noexcept { return buf_ == o.buf_; }

    // ---- neighbor transforms (defined in field/Transform.hpp) ----------------------------
    Field operator()(const FieldOffset& off) const;
    Field operator()(const NeighborSlot& slot) const;

  private:
    template <class> friend class Field;

    void init(Dims dims, std::vector<int> extents, const FieldOptions& opt)
    {
        if (has_duplicates(dims))
            throw ShapeError("Field dims contain duplicates: " + to_string(dims));
        if (dims.size() != extents.size())
            throw ShapeError("Field dims " + to_string(dims) + " do not match data rank " +
                             std::to_string(extents.size()));
        for (int e : extents)
            if (e < 0)
                throw ShapeError("Field extents must be non-negative");

        bdims_ = opt.broadcast_dims.empty() ? dims : opt.broadcast_dims;
        if (has_duplicates(bdims_) || !is_subset(dims, bdims_))
            throw ShapeError("broadcast dims " + to_string(bdims_) + " are not a superset of " +
                             to_string(dims));

        origin_.assign(dims.size(), 0);
        for (const auto& [d, o] : opt.origin)
            if (auto a = axis_index(dims, d))
                origin_[*a] = o;

        dims_ = std::move(dims);
        layout_ = layout::Strided::packed(std::move(extents));
        buf_ = memory::make_shared_buffer<T>(layout_.volume());
    }

    Dims dims_;
    Dims bdims_;
    std::vector<int> origin_;
    layout::Strided layout_;
    std::shared_ptr<T> buf_;
};

template <class T> std::ostream& operator<<(std::ostream& os, const Field<T>& f)
{
    os << element_type_name<T>() << " Field with dimensions " << to_string(f.broadcast_dims());
    if (f.rank() == 0)
        return os;
    os << " with indices ";
    for (std::size_t a = 0; a < f.rank(); ++a)
    {
        const auto r = f.range(a);
        os << (a ? "x" : "") << r.lo << ":" << r.hi;
    }
    return os;
}

// Elementwise copy of source into target; dims and extents must agree. Validates before
// writing anything.
template <class T, class U> void copy_field(Field<T>& target, const Field<U>& source)
{
    if (target.dims() != source.dims() || target.extents() != source.extents())
    {
        std::string e1, e2;
        for (int e : target.extents())
            e1 += std::to_string(e) + " ";
        for (int e : source.extents())
            e2 += std::to_string(e) + " ";
        throw ShapeError("cannot copy field over " + to_string(source.dims()) + " [ " + e2 +
                         "] into out field over " + to_string(target.dims()) + " [ " + e1 + "]");
    }
    if (target.size() == 0)
        return;
    std::vector<int> idx(target.rank(), 0);
    do
        target.local(idx) = static_cast<T>(source.local(idx));
    while (layout::next_index(idx, target.extents()));
}

} // namespace gridflow::field

#include "field/Transform.hpp"

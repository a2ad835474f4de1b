#include "field/Connectivity.hpp"
#include "master/Errors.hpp"

namespace gridflow::field
{

Connectivity::Connectivity(const Table& table, Dimension source, Dimension target,
                           int max_neighbors)
    : source_(std::move(source)), target_(std::move(target)), max_neighbors_(max_neighbors),
      rows_(static_cast<int>(table.size()))
{
    if (max_neighbors < 1)
        throw ConnectivityError("Connectivity " + to_string(source_) + "->" +
                                to_string(target_) + ": max_neighbors must be >= 1");
    data_.reserve(table.size() * static_cast<std::size_t>(max_neighbors));
    for (std::size_t r = 0; r < table.size(); ++r)
    {
        if (table[r].size() != static_cast<std::size_t>(max_neighbors))
            throw ShapeError("Connectivity " + to_string(source_) + "->" + to_string(target_) +
                             ": row " + std::to_string(r + 1) + " has " +
                             std::to_string(table[r].size()) + " entries, expected " +
                             std::to_string(max_neighbors));
        data_.insert(data_.end(), table[r].begin(), table[r].end());
    }
}

FieldOffset::FieldOffset(std::string name, Dimension source, Dims target)
    : name_(std::move(name)), source_(std::move(source)), target_(std::move(target))
{
    if (target_.empty())
        throw ShapeError("FieldOffset " + name_ + ": target dimensions must not be empty");
    for (std::size_t i = 1; i < target_.size(); ++i)
        if (!target_[i].is_local())
            throw ShapeError("FieldOffset " + name_ +
                             ": all but the first target dimension must be local, got " +
                             to_string(target_[i]));
}

} // namespace gridflow::field

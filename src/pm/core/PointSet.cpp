#include "pm/core/PointSet.hpp"
#include "pm/core/Errors.hpp"

#include <cmath>
#include <stdexcept>

namespace pm {

Point::Point(const PointSet& points, size_t index) : _points(&points), _index(index) {}

double Point::x() const { return _points->x()[_index]; }
double Point::y() const { return _points->y()[_index]; }
double Point::z() const { return _points->z()[_index]; }

cv::Vec3d Point::position() const
{
    return _points->coordinate(_index);
}

bool Point::has(const std::string& field) const
{
    return _points->hasField(field);
}

double Point::operator[](const std::string& field) const
{
    return _points->field(field)[_index];
}

PointSet::PointSet()
    : _x(std::make_shared<Column>()),
      _y(std::make_shared<Column>()),
      _z(std::make_shared<Column>())
{
}

PointSet::PointSet(Column x, Column y, Column z)
{
    if (x.size() != y.size() || x.size() != z.size()) {
        throw InvalidInputError("Coordinate columns differ in length: X=" + std::to_string(x.size()) +
                                " Y=" + std::to_string(y.size()) + " Z=" + std::to_string(z.size()));
    }
    _x = std::make_shared<const Column>(std::move(x));
    _y = std::make_shared<const Column>(std::move(y));
    _z = std::make_shared<const Column>(std::move(z));
}

PointSet::PointSet(const std::vector<cv::Vec3d>& coords)
{
    Column x, y, z;
    x.reserve(coords.size());
    y.reserve(coords.size());
    z.reserve(coords.size());
    for (const auto& p : coords) {
        x.push_back(p[0]);
        y.push_back(p[1]);
        z.push_back(p[2]);
    }
    _x = std::make_shared<const Column>(std::move(x));
    _y = std::make_shared<const Column>(std::move(y));
    _z = std::make_shared<const Column>(std::move(z));
}

bool PointSet::isCoordinateName(const std::string& name)
{
    return name == "X" || name == "Y" || name == "Z";
}

void PointSet::addAttribute(const std::string& name, Column values)
{
    if (name.empty()) {
        throw InvalidInputError("Attribute name must not be empty");
    }
    if (isCoordinateName(name)) {
        throw InvalidInputError("Attribute name '" + name + "' is reserved for coordinates");
    }
    if (_attributes.count(name)) {
        throw InvalidInputError("Duplicate attribute '" + name + "'");
    }
    if (values.size() != size()) {
        throw InvalidInputError("Attribute '" + name + "' has " + std::to_string(values.size()) +
                                " values, expected " + std::to_string(size()));
    }
    _attributes.emplace(name, std::make_shared<const Column>(std::move(values)));
    _attributeNames.push_back(name);
}

bool PointSet::hasField(const std::string& name) const
{
    return isCoordinateName(name) || _attributes.count(name) > 0;
}

const Column& PointSet::field(const std::string& name) const
{
    if (name == "X") return *_x;
    if (name == "Y") return *_y;
    if (name == "Z") return *_z;
    auto it = _attributes.find(name);
    if (it == _attributes.end()) {
        throw std::out_of_range("No field named '" + name + "'");
    }
    return *it->second;
}

ColumnPtr PointSet::sharedField(const std::string& name) const
{
    if (name == "X") return _x;
    if (name == "Y") return _y;
    if (name == "Z") return _z;
    auto it = _attributes.find(name);
    if (it == _attributes.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> PointSet::fieldNames() const
{
    std::vector<std::string> names{"X", "Y", "Z"};
    names.insert(names.end(), _attributeNames.begin(), _attributeNames.end());
    return names;
}

void PointSet::validate() const
{
    if (empty()) {
        throw InvalidInputError("Point set is empty");
    }
    for (size_t i = 0; i < size(); i++) {
        if (!std::isfinite((*_x)[i]) || !std::isfinite((*_y)[i]) || !std::isfinite((*_z)[i])) {
            throw InvalidInputError("Non-finite coordinate", i);
        }
    }
}

} // namespace pm

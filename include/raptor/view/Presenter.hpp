#pragma once

#include <boost/json.hpp>

namespace raptor::view {

// Render-facing wrapper around a record or a collection of records. Templates
// see exactly the names returned by fields().
class Presenter {
public:
    virtual ~Presenter() = default;

    virtual boost::json::object fields() const = 0;
};

} // namespace raptor::view

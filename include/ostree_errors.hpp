// ostree_errors.hpp
// Exception types thrown by the ostree containers.
//
// - duplicate_key:     insert of a key that is already present.
// - key_not_found:     erase/at of a key that is absent.
// - rank_out_of_range: order-statistics query with a rank outside [1, size].
// - table_full:        insert of a new key into a LinearProbeTable with no free slot.
//
// All of them leave the container unchanged.

#ifndef OSTREE_ERRORS_HPP
#define OSTREE_ERRORS_HPP

#include <stdexcept>

class duplicate_key : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class key_not_found : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

class rank_out_of_range : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

class table_full : public std::length_error {
public:
    using std::length_error::length_error;
};

#endif // OSTREE_ERRORS_HPP

#ifndef PLONKSHA_SYNTHESIS_ERROR_H_
#define PLONKSHA_SYNTHESIS_ERROR_H_

#include <stdexcept>
#include <string>

namespace libplonksha {

// Errors raised while laying out or witnessing a circuit

class synthesis_error : public std::runtime_error
{
public:
    explicit synthesis_error(const std::string& str) : std::runtime_error(str) {}
};

// A witness value was needed but the circuit is built without one
class assignment_missing : public synthesis_error {
public:
    assignment_missing() : synthesis_error("assignment missing") { }
};

class table_domain_error : public synthesis_error {
public:
    explicit table_domain_error(const std::string& table_name)
        : synthesis_error("key is outside of the domain of lookup table " + table_name) { }
};

class table_registration_error : public synthesis_error {
public:
    explicit table_registration_error(const std::string& str) : synthesis_error(str) { }
};

// SignificantOverflow has no reduction strategy in the sha256 gadget
class unsupported_overflow : public std::logic_error {
public:
    unsupported_overflow() : std::logic_error("values with significant overflow are not supported") { }
};

}

#endif // PLONKSHA_SYNTHESIS_ERROR_H_

#ifndef CIRCADIA_EXCEPTIONS_H
#define CIRCADIA_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Circadia {

class CircadiaException : public std::runtime_error {
public:
    explicit CircadiaException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CircadiaException {
public:
    explicit IOException(const std::string& message) : CircadiaException("IO Error: " + message) {}
};

class ConfigurationException : public CircadiaException {
public:
    explicit ConfigurationException(const std::string& message) : CircadiaException("Configuration Error: " + message) {}
};

class InsufficientDataException : public CircadiaException {
public:
    InsufficientDataException(const std::string& message, size_t required, size_t available)
        : CircadiaException("Insufficient Data: " + message +
                            " (required " + std::to_string(required) +
                            ", got " + std::to_string(available) + ")"),
          m_required(required),
          m_available(available) {}

    size_t required() const noexcept { return m_required; }
    size_t available() const noexcept { return m_available; }

private:
    size_t m_required;
    size_t m_available;
};

class NumericalDegeneracyException : public CircadiaException {
public:
    explicit NumericalDegeneracyException(const std::string& message) : CircadiaException("Numerical Degeneracy: " + message) {}
};

class NeuralNetException : public CircadiaException {
public:
    explicit NeuralNetException(const std::string& message) : CircadiaException("NeuralNet Error: " + message) {}
};

} // namespace Circadia

#endif // CIRCADIA_EXCEPTIONS_H

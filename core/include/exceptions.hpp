#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class SignalSynthesisException : public std::runtime_error {
    public:
        explicit SignalSynthesisException(const std::string& message)
            : std::runtime_error(message) {}

        explicit SignalSynthesisException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

    // Bar fetch failed or returned nothing usable for a (symbol, timeframe)
    class DataUnavailableException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

    class ApiRequestException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

    class IndicatorCalculationException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

    // Previous table unreadable; callers treat the table as empty
    class StoreReadException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

    // Fatal for a run; the previous store is left untouched
    class StoreWriteException : public SignalSynthesisException {
    public: using SignalSynthesisException::SignalSynthesisException; };

} // namespace core

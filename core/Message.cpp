/*
 * Message.cpp
 *
 *  Canonical message texts and the diagnostics switches read from the environment.
 */

#include "../headers/facet_internal.h"
#include <cstdlib>

namespace facet
{
    namespace Message
    {
        const char* const ChainSuperseded = "The chain link was replaced by its successor";
        const char* const ChainTerminated = "The chain has already been terminated";
        const char* const DivisionByZero = "Division by zero";
        const char* const NullOperand = "Operand cannot be null";
        const char* const OperationImpossible = "The operation is impossible";
        const char* const StandardObjectInoperable = "Standard object is inoperable";
        const char* const TypeAbsentParent = "A type cannot descend from the absent type";
        const char* const TypeExists = "Type is already declared";
        const char* const TypeForeign = "Parent type belongs to another type space";
        const char* const TypeTooDeep = "Type hierarchy is too deep";
        const char* const ZeroDenominator = "Denominator is zero";
        const char* const ZeroNumerator = "Numerator is zero";

        std::string colon(const std::string& msg)
        {
            if (msg.empty())
                return "";

            const size_t length = msg.size();
            if (length >= 2 && msg.compare(length - 2, 2, ": ") == 0)
                return msg;

            if (msg[length - 1] == ':')
                return msg + " ";

            return msg + ": ";
        }
    }

    bool diagnosticsRequested(const char* variable)
    {
        const char* value = std::getenv(variable);
        return value != nullptr && *value != '\0' && *value != '0';
    }

    bool operableDiagnostics()
    {
        static const bool enabled = diagnosticsRequested(FACET_OPERABLE_DIAG_ENV);
        return enabled;
    }
}

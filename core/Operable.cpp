/*
 * Operable.cpp
 *
 *  Failure reporting for operable values. The value classes are templates in
 *  facetCore.h; everything that logs or builds messages lives here.
 */

#include "../headers/facet_internal.h"
#include <cstdio>

namespace facet
{
    void reportMissingOperand(const char* operation)
    {
        if (operableDiagnostics()) {
            fprintf(stderr, "DEBUG: [OPERABLE] %s rejected: operand is missing\n", operation);
        }
        throw MissingArgument(Message::colon(Message::NullOperand) + operation);
    }

    void reportInoperable(const char* operation)
    {
        if (operableDiagnostics()) {
            fprintf(stderr, "DEBUG: [OPERABLE] %s rejected: value is locked\n", operation);
        }
        throw InvariantViolation(Message::colon(Message::StandardObjectInoperable) + operation);
    }

    void reportDivisionByZero(const char* operation)
    {
        if (operableDiagnostics()) {
            fprintf(stderr, "DEBUG: [OPERABLE] %s rejected: division by zero\n", operation);
        }
        throw ArithmeticError(Message::colon(Message::DivisionByZero) + operation);
    }
}

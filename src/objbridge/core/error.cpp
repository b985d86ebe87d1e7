#include <objbridge/core/error.hpp>

const char* ob_error_message(OBError code) {
    switch (code) {
        case OB_SUCCESS:
            return "Success";
        case OB_ERROR_NO_RUNTIME:
            return "No foreign runtime installed";
        case OB_ERROR_CLASS_NOT_FOUND:
            return "Class not found";
        case OB_ERROR_SELECTOR_NOT_FOUND:
            return "Selector not found on the ancestry chain";
        case OB_ERROR_NIL_RECEIVER:
            return "Message sent to nil";
        case OB_ERROR_ENCODING_MISMATCH:
            return "Method type encoding does not match the declared signature";
        case OB_ERROR_ARITY_MISMATCH:
            return "Argument count does not match the selector";
        case OB_ERROR_NUMERIC_OVERFLOW:
            return "Numeric value not representable in the target type";
        case OB_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case OB_ERROR_INVALID_HANDLE:
            return "Handle does not belong to the runtime";
        case OB_ERROR_OWNERSHIP_VIOLATION:
            return "Ownership discipline violated";
        case OB_ERROR_INVALID_DECLARATION:
            return "Malformed class, protocol or method declaration";
        case OB_ERROR_CLASS_EXISTS:
            return "Class already registered";
        case OB_ERROR_ANCESTRY_MISMATCH:
            return "Declared ancestry does not match the runtime";
        case OB_ERROR_NOT_SUPPORTED:
            return "Operation not supported by the runtime";
    }
    return "Unknown error";
}

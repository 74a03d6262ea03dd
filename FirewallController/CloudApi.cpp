// CloudApi.cpp
#include "CloudApi.h"

const char* ApiErrorKindLabel(ApiErrorKind kind) {
    switch (kind) {
        case ApiErrorKind::Network:    return "network";
        case ApiErrorKind::Auth:       return "authentication";
        case ApiErrorKind::RateLimit:  return "rate limit";
        case ApiErrorKind::Validation: return "validation";
        case ApiErrorKind::Server:     return "server";
        case ApiErrorKind::Protocol:   return "protocol";
    }
    return "unknown";
}

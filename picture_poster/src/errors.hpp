#pragma once
#include <string>

enum class ErrorKind {
    Validation,
    Persist,
    Send,
    NotFound
};

struct PosterError {
    ErrorKind kind;
    std::string message;
};

const char* to_string(ErrorKind kind);

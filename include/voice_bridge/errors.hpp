#pragma once

#include <stdexcept>
#include <string>

namespace voice_bridge {

class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& message) : std::runtime_error(message) {}
};

class TranscriptionError : public ServiceError {
public:
    explicit TranscriptionError(const std::string& message) : ServiceError(message) {}
};

class GenerationError : public ServiceError {
public:
    explicit GenerationError(const std::string& message) : ServiceError(message) {}
};

class SynthesisError : public ServiceError {
public:
    explicit SynthesisError(const std::string& message) : ServiceError(message) {}
};

class MalformedFrameError : public std::runtime_error {
public:
    explicit MalformedFrameError(const std::string& message) : std::runtime_error(message) {}
};

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

class DuplicateSessionError : public SessionError {
public:
    explicit DuplicateSessionError(const std::string& call_id)
        : SessionError("session already exists: " + call_id) {}
};

class UnknownSessionError : public SessionError {
public:
    explicit UnknownSessionError(const std::string& call_id)
        : SessionError("unknown session: " + call_id) {}
};

class SessionLimitError : public SessionError {
public:
    explicit SessionLimitError(const std::string& message) : SessionError(message) {}
};

}

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace vshadertest
{
    enum class ErrorCode : uint32_t
    {
        eOk = 0,
        eIO,
        eInvalidArgument,
        eParseError,
        eCompileError,
        eSpawnError,
        eImageError,
        eSubstitutionError
    };

    struct Error
    {
        ErrorCode   code = ErrorCode::eOk;
        std::string message;

        static Error ok() { return {ErrorCode::eOk, {}}; }
    };

    inline const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::eOk:
                return "ok";
            case ErrorCode::eIO:
                return "io";
            case ErrorCode::eInvalidArgument:
                return "invalid-argument";
            case ErrorCode::eParseError:
                return "parse";
            case ErrorCode::eCompileError:
                return "compile";
            case ErrorCode::eSpawnError:
                return "spawn";
            case ErrorCode::eImageError:
                return "image";
            case ErrorCode::eSubstitutionError:
                return "substitution";
            default:
                return "unknown";
        }
    }

    template<typename T>
    class Result
    {
    public:
        static Result ok(T value)
        {
            Result r;
            r.m_Ok    = true;
            r.m_Value = std::move(value);
            return r;
        }

        static Result err(Error e)
        {
            Result r;
            r.m_Ok    = false;
            r.m_Error = std::move(e);
            return r;
        }

        bool         isOk() const { return m_Ok; }
        const T&     value() const { return m_Value; }
        T&           value() { return m_Value; }
        const Error& error() const { return m_Error; }

    private:
        bool  m_Ok = false;
        T     m_Value {};
        Error m_Error {};
    };

    template<>
    class Result<void>
    {
    public:
        static Result ok()
        {
            Result r;
            r.m_Ok = true;
            return r;
        }

        static Result err(Error e)
        {
            Result r;
            r.m_Ok    = false;
            r.m_Error = std::move(e);
            return r;
        }

        bool         isOk() const { return m_Ok; }
        const Error& error() const { return m_Error; }

    private:
        bool  m_Ok = false;
        Error m_Error {};
    };
} // namespace vshadertest

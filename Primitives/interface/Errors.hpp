/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

#include <stdexcept>
#include <string>

#include "DebugOutput.h"
#include "FormatString.hpp"

namespace Bindery
{

template <bool>
void ThrowIf(std::string&&)
{
}

template <>
inline void ThrowIf<true>(std::string&& msg)
{
    throw std::runtime_error(std::move(msg));
}

/// Strips the directory part from the full path reported by __FILE__
inline const Char* GetFileNameFromPath(const Char* FullFilePath)
{
    const Char* FileName = FullFilePath;
    for (const Char* c = FullFilePath; *c != '\0'; ++c)
    {
        if (*c == '/' || *c == '\\')
            FileName = c + 1;
    }
    return FileName;
}

template <bool bThrowException, typename... ArgsType>
void LogError(const Char* Function, const Char* FullFilePath, int Line, const ArgsType&... Args)
{
    std::string Msg = FormatString(Args...);
    DebugMessageCallback(bThrowException ? DEBUG_MESSAGE_SEVERITY_FATAL_ERROR : DEBUG_MESSAGE_SEVERITY_ERROR,
                         Msg.c_str(), Function, GetFileNameFromPath(FullFilePath), Line);
    ThrowIf<bThrowException>(std::move(Msg));
}

} // namespace Bindery


#define LOG_ERROR(...)                                                              \
    do                                                                              \
    {                                                                               \
        Bindery::LogError<false>(__FUNCTION__, __FILE__, __LINE__, ##__VA_ARGS__); \
    } while (false)


#define LOG_ERROR_ONCE(...)             \
    do                                  \
    {                                   \
        static bool IsFirstTime = true; \
        if (IsFirstTime)                \
        {                               \
            LOG_ERROR(__VA_ARGS__);     \
            IsFirstTime = false;        \
        }                               \
    } while (false)


#define LOG_ERROR_AND_THROW(...)                                                   \
    do                                                                             \
    {                                                                              \
        Bindery::LogError<true>(__FUNCTION__, __FILE__, __LINE__, ##__VA_ARGS__); \
    } while (false)


#define LOG_DEBUG_MESSAGE(Severity, ...)                                                          \
    do                                                                                            \
    {                                                                                             \
        auto _msg = Bindery::FormatString(__VA_ARGS__);                                           \
        Bindery::DebugMessageCallback(Severity, _msg.c_str(), nullptr, nullptr, 0);               \
    } while (false)

#define LOG_FATAL_ERROR_MESSAGE(...) LOG_DEBUG_MESSAGE(Bindery::DEBUG_MESSAGE_SEVERITY_FATAL_ERROR, ##__VA_ARGS__)
#define LOG_ERROR_MESSAGE(...)       LOG_DEBUG_MESSAGE(Bindery::DEBUG_MESSAGE_SEVERITY_ERROR, ##__VA_ARGS__)
#define LOG_WARNING_MESSAGE(...)     LOG_DEBUG_MESSAGE(Bindery::DEBUG_MESSAGE_SEVERITY_WARNING, ##__VA_ARGS__)
#define LOG_INFO_MESSAGE(...)        LOG_DEBUG_MESSAGE(Bindery::DEBUG_MESSAGE_SEVERITY_INFO, ##__VA_ARGS__)


#define LOG_DEBUG_MESSAGE_ONCE(Severity, ...)           \
    do                                                  \
    {                                                   \
        static bool IsFirstTime = true;                 \
        if (IsFirstTime)                                \
        {                                               \
            LOG_DEBUG_MESSAGE(Severity, ##__VA_ARGS__); \
            IsFirstTime = false;                        \
        }                                               \
    } while (false)

#define LOG_ERROR_MESSAGE_ONCE(...)   LOG_DEBUG_MESSAGE_ONCE(Bindery::DEBUG_MESSAGE_SEVERITY_ERROR, ##__VA_ARGS__)
#define LOG_WARNING_MESSAGE_ONCE(...) LOG_DEBUG_MESSAGE_ONCE(Bindery::DEBUG_MESSAGE_SEVERITY_WARNING, ##__VA_ARGS__)
#define LOG_INFO_MESSAGE_ONCE(...)    LOG_DEBUG_MESSAGE_ONCE(Bindery::DEBUG_MESSAGE_SEVERITY_INFO, ##__VA_ARGS__)


#define CHECK(Expr, Severity, ...)                      \
    do                                                  \
    {                                                   \
        if (!(Expr))                                    \
        {                                               \
            LOG_DEBUG_MESSAGE(Severity, ##__VA_ARGS__); \
        }                                               \
    } while (false)

#define CHECK_ERR(Expr, ...)  CHECK(Expr, Bindery::DEBUG_MESSAGE_SEVERITY_ERROR, ##__VA_ARGS__)
#define CHECK_WARN(Expr, ...) CHECK(Expr, Bindery::DEBUG_MESSAGE_SEVERITY_WARNING, ##__VA_ARGS__)
#define CHECK_INFO(Expr, ...) CHECK(Expr, Bindery::DEBUG_MESSAGE_SEVERITY_INFO, ##__VA_ARGS__)

#define CHECK_THROW(Expr, ...)                  \
    do                                          \
    {                                           \
        if (!(Expr))                            \
        {                                       \
            LOG_ERROR_AND_THROW(__VA_ARGS__);   \
        }                                       \
    } while (false)


#ifdef BINDERY_DEVELOPMENT

#    define DEV_CHECK_ERR(Expr, ...)  CHECK_ERR(Expr, ##__VA_ARGS__)
#    define DEV_CHECK_WARN(Expr, ...) CHECK_WARN(Expr, ##__VA_ARGS__)
#    define DEV_CHECK_INFO(Expr, ...) CHECK_INFO(Expr, ##__VA_ARGS__)

#else

#    define DEV_CHECK_ERR(Expr, ...) \
        do {} while (false)
#    define DEV_CHECK_WARN(Expr, ...) \
        do {} while (false)
#    define DEV_CHECK_INFO(Expr, ...) \
        do {} while (false)

#endif

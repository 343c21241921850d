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


#include "BasicPlatformDebug.hpp"

#include <iostream>
#include <sstream>
#include <cstdlib>

#include "FormatString.hpp"

namespace Bindery
{

DebugMessageCallbackType DebugMessageCallback = BasicPlatformDebug::OutputDebugMessage;

void SetDebugMessageCallback(DebugMessageCallbackType MessageCallback)
{
    DebugMessageCallback = MessageCallback != nullptr ? MessageCallback : BasicPlatformDebug::OutputDebugMessage;
}

const Char* GetDebugMessageSeverityString(DEBUG_MESSAGE_SEVERITY Severity)
{
    switch (Severity)
    {
        // clang-format off
        case DEBUG_MESSAGE_SEVERITY_INFO:        return "Info";
        case DEBUG_MESSAGE_SEVERITY_WARNING:     return "Warning";
        case DEBUG_MESSAGE_SEVERITY_ERROR:       return "Error";
        case DEBUG_MESSAGE_SEVERITY_FATAL_ERROR: return "Fatal error";
        // clang-format on
        default: return "<Unknown severity>";
    }
}

String BasicPlatformDebug::FormatDebugMessage(DEBUG_MESSAGE_SEVERITY Severity,
                                              const Char*            Message,
                                              const Char*            Function,
                                              const Char*            File,
                                              int                    Line)
{
    std::stringstream ss;
    ss << "Bindery: " << GetDebugMessageSeverityString(Severity);
    if (Function != nullptr || File != nullptr)
    {
        ss << " in ";
        if (Function != nullptr)
            ss << Function << "()";
        if (File != nullptr)
            ss << " (" << File << ", " << Line << ')';
    }
    ss << ": " << Message << '\n';
    return ss.str();
}

void BasicPlatformDebug::OutputDebugMessage(DEBUG_MESSAGE_SEVERITY Severity,
                                            const Char*            Message,
                                            const Char*            Function,
                                            const Char*            File,
                                            int                    Line)
{
    auto Msg = FormatDebugMessage(Severity, Message, Function, File, Line);
    std::cerr << Msg;
}

void BasicPlatformDebug::AssertionFailed(const Char* Message, const Char* Function, const Char* File, int Line)
{
    auto AssertionFailedMessage = FormatString("Debug assertion failed in ", Function, "(), file ", File, ", line ", Line, ":\n", Message);
    OutputDebugMessage(DEBUG_MESSAGE_SEVERITY_ERROR, AssertionFailedMessage.c_str(), nullptr, nullptr, 0);
    std::abort();
}

} // namespace Bindery

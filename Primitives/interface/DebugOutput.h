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

/// \file
/// Debug message output facilities

#include "BasicTypes.h"

namespace Bindery
{

/// Describes debug message severity
enum DEBUG_MESSAGE_SEVERITY : Int32
{
    /// Information message
    DEBUG_MESSAGE_SEVERITY_INFO = 0,

    /// Warning message
    DEBUG_MESSAGE_SEVERITY_WARNING,

    /// Error, with potential recovery
    DEBUG_MESSAGE_SEVERITY_ERROR,

    /// Fatal error - recovery is not possible
    DEBUG_MESSAGE_SEVERITY_FATAL_ERROR
};

/// Type of the callback function that is called to output a debug message.

/// \param [in] Severity - Message severity.
/// \param [in] Message  - Message text.
/// \param [in] Function - Name of the function that generated the message, or null.
/// \param [in] File     - Source file name, or null.
/// \param [in] Line     - Line number in the source file.
using DebugMessageCallbackType = void (*)(DEBUG_MESSAGE_SEVERITY Severity,
                                          const Char*            Message,
                                          const Char*            Function,
                                          const Char*            File,
                                          int                    Line);

/// Currently installed debug message callback. Never null: the platform
/// debug output routine is installed by default.
extern DebugMessageCallbackType DebugMessageCallback;

/// Installs the debug message callback. Passing null restores the default one.
void SetDebugMessageCallback(DebugMessageCallbackType MessageCallback);

/// Returns the human-readable name of the severity level.
const Char* GetDebugMessageSeverityString(DEBUG_MESSAGE_SEVERITY Severity);

} // namespace Bindery

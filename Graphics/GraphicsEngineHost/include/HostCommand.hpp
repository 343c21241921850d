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
/// Commands recorded by deferred contexts of the host-memory backend

#include <vector>

#include "RefCntAutoPtr.hpp"
#include "Buffer.h"
#include "Texture.h"
#include "ShaderProgram.h"

namespace Bindery
{

enum HOST_COMMAND_TYPE : Uint8
{
    HOST_COMMAND_UPDATE_BUFFER = 0,
    HOST_COMMAND_SET_PROGRAM_CONSTANT_BUFFER,
    HOST_COMMAND_SET_PROGRAM_BUFFER,
    HOST_COMMAND_SET_PROGRAM_TEXTURE,
    HOST_COMMAND_SET_PROGRAM_KEYWORD,
    HOST_COMMAND_SET_GLOBAL_CONSTANT_BUFFER,
    HOST_COMMAND_SET_GLOBAL_BUFFER,
    HOST_COMMAND_SET_GLOBAL_TEXTURE,
    HOST_COMMAND_SET_GLOBAL_KEYWORD,
    HOST_COMMAND_TYPE_COUNT
};

/// A single recorded command. Only the members used by the command type are set.

/// The command keeps strong references to the objects it uses and owns a copy
/// of the data, so the caller may release or reuse them right after recording.
struct HostCommand
{
    HOST_COMMAND_TYPE Type = HOST_COMMAND_TYPE_COUNT;

    RefCntAutoPtr<IShaderProgram> pProgram;
    RefCntAutoPtr<IBuffer>        pBuffer;
    RefCntAutoPtr<ITexture>       pTexture;

    ShaderPropertyID Slot   = INVALID_SHADER_PROPERTY_ID;
    Uint32           Kernel = 0;

    Uint64 Offset = 0;
    Uint64 Size   = 0;

    String Keyword;
    bool   Enable = false;

    std::vector<Uint8> Data;

    explicit HostCommand(HOST_COMMAND_TYPE _Type) :
        Type{_Type}
    {}
};

/// Returns the literal name of the command type (e.g. "SetProgramBuffer")
const Char* GetHostCommandTypeString(HOST_COMMAND_TYPE Type);

} // namespace Bindery

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
/// Definition of the Bindery::IShaderProgramHost interface

#include "../../GraphicsEngine/interface/ShaderProgram.h"
#include "ParameterBlockHost.hpp"

namespace Bindery
{

// {9E2A7C14-3B5D-4F80-A6C1-7E4B2D9F0A35}
static constexpr INTERFACE_ID IID_ShaderProgramHost =
    {0x9e2a7c14, 0x3b5d, 0x4f80, {0xa6, 0xc1, 0x7e, 0x4b, 0x2d, 0x9f, 0x0a, 0x35}};

/// Exposes host-backend-specific functionality of a shader program object.
class IShaderProgramHost : public IShaderProgram
{
public:
    /// Returns the program-wide parameters: constant buffers and keywords
    virtual const ParameterBlockHost& GetProgramParameters() const = 0;

    /// Returns the buffers and textures bound to the kernel
    virtual const ParameterBlockHost& GetKernelParameters(Uint32 Kernel) const = 0;
};

} // namespace Bindery

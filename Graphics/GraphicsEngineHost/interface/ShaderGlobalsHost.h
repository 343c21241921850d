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
/// Definition of the Bindery::IShaderGlobalsHost interface

#include "../../GraphicsEngine/interface/ShaderGlobals.h"
#include "ParameterBlockHost.hpp"

namespace Bindery
{

// {D5A3B961-2E8F-4C07-9B14-6F0E8C2A5D37}
static constexpr INTERFACE_ID IID_ShaderGlobalsHost =
    {0xd5a3b961, 0x2e8f, 0x4c07, {0x9b, 0x14, 0x6f, 0x0e, 0x8c, 0x2a, 0x5d, 0x37}};

/// Exposes host-backend-specific functionality of the pipeline-wide shader state.
class IShaderGlobalsHost : public IShaderGlobals
{
public:
    virtual const ParameterBlockHost& GetParameters() const = 0;
};

} // namespace Bindery

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
/// Defines Bindery::IShaderGlobals interface

#include "../../../Primitives/interface/Object.h"
#include "Buffer.h"
#include "Texture.h"

namespace Bindery
{

// {8B1E5F47-6A0C-4C39-A7D2-0F5E3B9C4A18}
static constexpr INTERFACE_ID IID_ShaderGlobals =
    {0x8b1e5f47, 0x6a0c, 0x4c39, {0xa7, 0xd2, 0x0f, 0x5e, 0x3b, 0x9c, 0x4a, 0x18}};

/// Pipeline-wide shader state

/// Resources and keywords set through this interface are visible to every
/// program and material that does not override them. The object is owned by
/// the render device, see IRenderDevice::GetShaderGlobals().
class IShaderGlobals : public IObject
{
public:
    virtual void SetGlobalConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) = 0;

    virtual void SetGlobalBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) = 0;

    virtual void SetGlobalTexture(ShaderPropertyID Slot, ITexture* pTexture) = 0;

    /// Enables a global keyword
    virtual void EnableKeyword(const Char* Name) = 0;

    /// Disables a global keyword
    virtual void DisableKeyword(const Char* Name) = 0;
};

} // namespace Bindery

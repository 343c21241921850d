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
/// Defines Bindery::IMaterial interface

#include "DeviceObject.h"
#include "Buffer.h"
#include "Texture.h"

namespace Bindery
{

// {3D6C0E2A-8F24-4D8A-9E53-1C4B7A2F9D61}
static constexpr INTERFACE_ID IID_Material =
    {0x3d6c0e2a, 0x8f24, 0x4d8a, {0x9e, 0x53, 0x1c, 0x4b, 0x7a, 0x2f, 0x9d, 0x61}};

/// Material description
struct MaterialDesc : DeviceObjectAttribs
{
    MaterialDesc() noexcept {}

    explicit MaterialDesc(const Char* _Name) noexcept :
        DeviceObjectAttribs{_Name}
    {}
};

/// Material interface

/// A material instance owns a parameter block that is consumed by the draws
/// that use the material. Bindings and keywords are local to the instance.
class IMaterial : public IDeviceObject
{
public:
    virtual const MaterialDesc& GetDesc() const override = 0;

    /// Binds a range of the buffer as a constant buffer of the instance
    virtual void SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) = 0;

    virtual void SetBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) = 0;

    virtual void SetTexture(ShaderPropertyID Slot, ITexture* pTexture) = 0;

    /// Enables or disables a keyword of the instance
    virtual void SetKeyword(const Char* Name, bool Enable) = 0;
};

} // namespace Bindery

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
/// Definition of the Bindery::ITextureHost interface

#include "../../GraphicsEngine/interface/Texture.h"

namespace Bindery
{

// {1C8E4D52-7F3A-4B6D-8E21-5D9A0F4C3B72}
static constexpr INTERFACE_ID IID_TextureHost =
    {0x1c8e4d52, 0x7f3a, 0x4b6d, {0x8e, 0x21, 0x5d, 0x9a, 0x0f, 0x4c, 0x3b, 0x72}};

/// Exposes host-backend-specific functionality of a texture object.
class ITextureHost : public ITexture
{
public:
    /// Returns a pointer to the texture storage, or null if the texture is not valid
    virtual const void* GetData() const = 0;

    /// Returns the size of the texture storage including all mip levels, in bytes
    virtual Uint64 GetDataSize() const = 0;
};

} // namespace Bindery

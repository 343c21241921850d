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
/// Defines Bindery::ITexture interface and related data structures

#include "DeviceObject.h"

namespace Bindery
{

// {A64B0E60-1B5E-4CFD-B880-663A1ADCBE98}
static constexpr INTERFACE_ID IID_Texture =
    {0xa64b0e60, 0x1b5e, 0x4cfd, {0xb8, 0x80, 0x66, 0x3a, 0x1a, 0xdc, 0xbe, 0x98}};

/// Maximum width and height of a 2D texture
static constexpr Uint32 MAX_TEXTURE_2D_DIMENSION = 16384;

/// Maximum width, height and depth of a 3D texture
static constexpr Uint32 MAX_TEXTURE_3D_DIMENSION = 2048;

/// Texture description
struct TextureDesc : DeviceObjectAttribs
{
    /// Texture type. See Bindery::RESOURCE_DIMENSION for details.
    RESOURCE_DIMENSION Type = RESOURCE_DIM_UNDEFINED;

    /// Texture width, in pixels.
    Uint32 Width = 0;

    /// Texture height, in pixels.
    Uint32 Height = 0;

    /// For a 3D texture, number of depth slices. Must be 1 for 2D textures.
    Uint32 Depth = 1;

    /// Texture format, see Bindery::TEXTURE_FORMAT.
    TEXTURE_FORMAT Format = TEX_FORMAT_UNKNOWN;

    /// Render texture format the texture was requested with, or RTF_UNDEFINED
    /// if the texture was requested with a precise texture format.
    RENDER_TEXTURE_FORMAT RenderFormat = RTF_UNDEFINED;

    /// Number of Mip levels in the texture.
    Uint32 MipLevels = 1;

    /// Number of samples. Only single-sampled textures are supported.
    Uint32 SampleCount = 1;

    /// Bind flags, see Bindery::BIND_FLAGS for details.
    BIND_FLAGS BindFlags = BIND_NONE;

    /// Address mode of the texture's default sampler.
    TEXTURE_ADDRESS_MODE AddressMode = TEXTURE_ADDRESS_WRAP;

    /// Resource lifetime, see Bindery::RESOURCE_LIFETIME.
    RESOURCE_LIFETIME Lifetime = RESOURCE_LIFETIME_TRACKED;

    TextureDesc() noexcept {}

    /// Tests if two texture descriptions are equal.

    /// \note Name is ignored by the comparison.
    bool operator==(const TextureDesc& RHS) const noexcept
    {
        // clang-format off
        return Type         == RHS.Type         &&
               Width        == RHS.Width        &&
               Height       == RHS.Height       &&
               Depth        == RHS.Depth        &&
               Format       == RHS.Format       &&
               RenderFormat == RHS.RenderFormat &&
               MipLevels    == RHS.MipLevels    &&
               SampleCount  == RHS.SampleCount  &&
               BindFlags    == RHS.BindFlags    &&
               AddressMode  == RHS.AddressMode  &&
               Lifetime     == RHS.Lifetime;
        // clang-format on
    }

    bool operator!=(const TextureDesc& RHS) const noexcept
    {
        return !(*this == RHS);
    }
};

/// Texture interface
class ITexture : public IDeviceObject
{
public:
    /// Returns the texture description used to create the object
    virtual const TextureDesc& GetDesc() const override = 0;

    /// Returns true if the texture memory is resident and can be bound.
    virtual bool IsValid() const = 0;
};

} // namespace Bindery

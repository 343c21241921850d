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
/// Contains basic graphics engine type definitions

#include "../../../Primitives/interface/BasicTypes.h"
#include "../../../Primitives/interface/FlagEnum.h"

namespace Bindery
{

/// Identifier of a named shader parameter slot, see GetShaderPropertyID().
using ShaderPropertyID = Int32;

/// Value that never identifies a registered shader property
static constexpr ShaderPropertyID INVALID_SHADER_PROPERTY_ID = -1;

/// Resource binding flags

/// The flags define how a resource may be bound to the pipeline.
/// Multiple flags may be combined with the bitwise OR operator.
enum BIND_FLAGS : Uint32
{
    /// Undefined binding.
    BIND_NONE = 0u,

    /// A buffer can be bound as a uniform (constant) buffer.
    BIND_UNIFORM_BUFFER = 1u << 0u,

    /// A buffer or a texture can be bound as a shader resource.
    BIND_SHADER_RESOURCE = 1u << 1u,

    /// A buffer or a texture can be bound as an unordered access view.
    BIND_UNORDERED_ACCESS = 1u << 2u,

    /// A buffer can be bound as the source buffer for indirect dispatch commands.
    BIND_INDIRECT_DRAW_ARGS = 1u << 3u,

    BIND_FLAG_LAST = BIND_INDIRECT_DRAW_ARGS
};
DEFINE_FLAG_ENUM_OPERATORS(BIND_FLAGS)


/// Describes resource dimension
enum RESOURCE_DIMENSION : Uint8
{
    RESOURCE_DIM_UNDEFINED = 0, ///< Texture type undefined
    RESOURCE_DIM_BUFFER,        ///< Buffer
    RESOURCE_DIM_TEX_2D,        ///< Two-dimensional texture
    RESOURCE_DIM_TEX_3D,        ///< Three-dimensional texture
    RESOURCE_DIM_NUM_DIMENSIONS
};


/// Texture formats

/// The enumeration describes the precise channel layout of a texel.
/// Every value except TEX_FORMAT_UNKNOWN is a valid storage format for a volume.
enum TEXTURE_FORMAT : Uint16
{
    /// Unknown format
    TEX_FORMAT_UNKNOWN = 0,

    // clang-format off
    TEX_FORMAT_RGBA32_FLOAT,     ///< Four-component 128-bit floating-point format
    TEX_FORMAT_RGBA32_UINT,      ///< Four-component 128-bit unsigned-integer format
    TEX_FORMAT_RGBA32_SINT,      ///< Four-component 128-bit signed-integer format
    TEX_FORMAT_RGBA16_FLOAT,     ///< Four-component 64-bit half-precision floating-point format
    TEX_FORMAT_RGBA16_UNORM,     ///< Four-component 64-bit unsigned-normalized-integer format
    TEX_FORMAT_RGBA16_UINT,      ///< Four-component 64-bit unsigned-integer format
    TEX_FORMAT_RGBA16_SINT,      ///< Four-component 64-bit signed-integer format
    TEX_FORMAT_RG32_FLOAT,       ///< Two-component 64-bit floating-point format
    TEX_FORMAT_RG32_UINT,        ///< Two-component 64-bit unsigned-integer format
    TEX_FORMAT_RG32_SINT,        ///< Two-component 64-bit signed-integer format
    TEX_FORMAT_R11G11B10_FLOAT,  ///< Three-component 32-bit packed floating-point format
    TEX_FORMAT_RGBA8_UNORM,      ///< Four-component 32-bit unsigned-normalized-integer format
    TEX_FORMAT_RGBA8_UINT,       ///< Four-component 32-bit unsigned-integer format
    TEX_FORMAT_RG16_FLOAT,       ///< Two-component 32-bit half-precision floating-point format
    TEX_FORMAT_RG16_UNORM,       ///< Two-component 32-bit unsigned-normalized-integer format
    TEX_FORMAT_R32_FLOAT,        ///< Single-component 32-bit floating-point format
    TEX_FORMAT_R32_UINT,         ///< Single-component 32-bit unsigned-integer format
    TEX_FORMAT_R32_SINT,         ///< Single-component 32-bit signed-integer format
    TEX_FORMAT_R16_FLOAT,        ///< Single-component 16-bit half-precision floating-point format
    TEX_FORMAT_R16_UNORM,        ///< Single-component 16-bit unsigned-normalized-integer format
    TEX_FORMAT_R16_UINT,         ///< Single-component 16-bit unsigned-integer format
    TEX_FORMAT_R8_UNORM,         ///< Single-component 8-bit unsigned-normalized-integer format
    TEX_FORMAT_R8_UINT,          ///< Single-component 8-bit unsigned-integer format
    // clang-format on

    /// Helper member containing the total number of texture formats in the enumeration
    TEX_FORMAT_NUM_FORMATS
};


/// Fixed-function render texture formats

/// Coarse render-target formats as exposed by render-pipeline front ends.
/// Each value maps to exactly one TEXTURE_FORMAT, see RenderTextureFormatToTextureFormat().
enum RENDER_TEXTURE_FORMAT : Uint8
{
    RTF_UNDEFINED = 0,

    // clang-format off
    RTF_ARGB32,          ///< 8 bits per channel, four channels
    RTF_ARGB_HALF,       ///< 16-bit floating point per channel, four channels
    RTF_ARGB_FLOAT,      ///< 32-bit floating point per channel, four channels
    RTF_ARGB_INT,        ///< 32-bit signed integer per channel, four channels
    RTF_RGBA_USHORT,     ///< 16-bit unsigned normalized per channel, four channels
    RTF_RGB111110_FLOAT, ///< Packed 11-11-10 floating point, three channels
    RTF_RG_FLOAT,        ///< 32-bit floating point, two channels
    RTF_RG_HALF,         ///< 16-bit floating point, two channels
    RTF_RG_INT,          ///< 32-bit signed integer, two channels
    RTF_R_FLOAT,         ///< 32-bit floating point, single channel
    RTF_R_HALF,          ///< 16-bit floating point, single channel
    RTF_R_INT,           ///< 32-bit signed integer, single channel
    RTF_R8,              ///< 8-bit unsigned normalized, single channel
    RTF_R16,             ///< 16-bit unsigned normalized, single channel
    // clang-format on

    RTF_NUM_FORMATS
};


/// Describes the component type of a texture format
enum COMPONENT_TYPE : Uint8
{
    COMPONENT_TYPE_UNDEFINED, ///< Undefined component type
    COMPONENT_TYPE_FLOAT,     ///< Floating point component type
    COMPONENT_TYPE_SNORM,     ///< Signed-normalized-integer component type
    COMPONENT_TYPE_UNORM,     ///< Unsigned-normalized-integer component type
    COMPONENT_TYPE_SINT,      ///< Signed-integer component type
    COMPONENT_TYPE_UINT,      ///< Unsigned-integer component type
    COMPONENT_TYPE_COMPOUND   ///< Compound component type (e.g. packed 11-11-10)
};


/// Texture address mode

/// Defines how out-of-range texture coordinates are resolved by the default sampler
/// of a texture.
enum TEXTURE_ADDRESS_MODE : Uint8
{
    TEXTURE_ADDRESS_UNKNOWN = 0, ///< Unknown mode
    TEXTURE_ADDRESS_WRAP,        ///< Tile the texture at every integer junction
    TEXTURE_ADDRESS_MIRROR,      ///< Flip the texture at every integer junction
    TEXTURE_ADDRESS_CLAMP,       ///< Clamp coordinates to [0, 1]
    TEXTURE_ADDRESS_NUM_MODES
};


/// Resource lifetime

/// Tracked resources may be reclaimed by the device, see IRenderDeviceHost::ReleaseTrackedResources().
/// Explicit resources live until their last reference is released.
enum RESOURCE_LIFETIME : Uint8
{
    RESOURCE_LIFETIME_TRACKED = 0,
    RESOURCE_LIFETIME_EXPLICIT
};


/// Describes texture format attributes, see GetTextureFormatAttribs().
struct TextureFormatAttribs
{
    /// Literal texture format name (e.g. "TEX_FORMAT_RGBA8_UNORM")
    const Char* Name = "TEX_FORMAT_UNKNOWN";

    TEXTURE_FORMAT Format = TEX_FORMAT_UNKNOWN;

    /// Size of one component in bytes. For compound formats, the size of the whole texel.
    Uint8 ComponentSize = 0;

    /// Number of components
    Uint8 NumComponents = 0;

    COMPONENT_TYPE ComponentType = COMPONENT_TYPE_UNDEFINED;

    constexpr TextureFormatAttribs() noexcept {}

    constexpr TextureFormatAttribs(const Char*    _Name,
                                   TEXTURE_FORMAT _Format,
                                   Uint8          _ComponentSize,
                                   Uint8          _NumComponents,
                                   COMPONENT_TYPE _ComponentType) noexcept :
        // clang-format off
        Name         {_Name         },
        Format       {_Format       },
        ComponentSize{_ComponentSize},
        NumComponents{_NumComponents},
        ComponentType{_ComponentType}
    // clang-format on
    {
    }

    /// Returns the size of one texel in bytes
    Uint32 GetElementSize() const
    {
        return ComponentType == COMPONENT_TYPE_COMPOUND ?
            Uint32{ComponentSize} :
            Uint32{ComponentSize} * Uint32{NumComponents};
    }
};


/// Describes common device object attributes
struct DeviceObjectAttribs
{
    /// Object name
    const Char* Name = nullptr;

    DeviceObjectAttribs() noexcept {}

    explicit DeviceObjectAttribs(const Char* _Name) noexcept :
        Name{_Name}
    {}
};


/// Device memory statistics reported by the render device
struct DeviceMemoryStats
{
    /// Total size of all live buffers and textures, in bytes
    Uint64 AllocatedBytes = 0;

    /// Number of live buffers
    Uint32 NumBuffers = 0;

    /// Number of live textures
    Uint32 NumTextures = 0;

    /// Total number of buffer allocations made by the device
    Uint64 NumBufferAllocations = 0;

    /// Total number of texture allocations made by the device
    Uint64 NumTextureAllocations = 0;
};

} // namespace Bindery

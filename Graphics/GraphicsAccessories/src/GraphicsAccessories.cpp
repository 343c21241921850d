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


#include "GraphicsAccessories.hpp"

#include <array>
#include <algorithm>
#include <string>

#include "DebugUtilities.hpp"

namespace Bindery
{

const TextureFormatAttribs& GetTextureFormatAttribs(TEXTURE_FORMAT Format)
{
    static const std::array<TextureFormatAttribs, TEX_FORMAT_NUM_FORMATS> FmtAttribs = []() {
        std::array<TextureFormatAttribs, TEX_FORMAT_NUM_FORMATS> Attribs;
        // clang-format off
#define INIT_TEX_FORMAT_INFO(TexFmt, ComponentSize, NumComponents, ComponentType) \
        Attribs[TexFmt] = TextureFormatAttribs{#TexFmt, TexFmt, ComponentSize, NumComponents, ComponentType}

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA32_FLOAT,    4, 4, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA32_UINT,     4, 4, COMPONENT_TYPE_UINT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA32_SINT,     4, 4, COMPONENT_TYPE_SINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA16_FLOAT,    2, 4, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA16_UNORM,    2, 4, COMPONENT_TYPE_UNORM);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA16_UINT,     2, 4, COMPONENT_TYPE_UINT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA16_SINT,     2, 4, COMPONENT_TYPE_SINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RG32_FLOAT,      4, 2, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RG32_UINT,       4, 2, COMPONENT_TYPE_UINT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RG32_SINT,       4, 2, COMPONENT_TYPE_SINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R11G11B10_FLOAT, 4, 3, COMPONENT_TYPE_COMPOUND);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA8_UNORM,     1, 4, COMPONENT_TYPE_UNORM);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RGBA8_UINT,      1, 4, COMPONENT_TYPE_UINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RG16_FLOAT,      2, 2, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_RG16_UNORM,      2, 2, COMPONENT_TYPE_UNORM);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R32_FLOAT,       4, 1, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R32_UINT,        4, 1, COMPONENT_TYPE_UINT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R32_SINT,        4, 1, COMPONENT_TYPE_SINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R16_FLOAT,       2, 1, COMPONENT_TYPE_FLOAT);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R16_UNORM,       2, 1, COMPONENT_TYPE_UNORM);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R16_UINT,        2, 1, COMPONENT_TYPE_UINT);

        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R8_UNORM,        1, 1, COMPONENT_TYPE_UNORM);
        INIT_TEX_FORMAT_INFO(TEX_FORMAT_R8_UINT,         1, 1, COMPONENT_TYPE_UINT);
#undef  INIT_TEX_FORMAT_INFO
        // clang-format on
        static_assert(TEX_FORMAT_NUM_FORMATS == TEX_FORMAT_R8_UINT + 1, "Not all texture formats initialized.");

#ifdef BINDERY_DEBUG
        for (Uint32 Fmt = TEX_FORMAT_UNKNOWN; Fmt < TEX_FORMAT_NUM_FORMATS; ++Fmt)
            VERIFY(Attribs[Fmt].Format == static_cast<TEXTURE_FORMAT>(Fmt), "Uninitialized format");
#endif
        return Attribs;
    }();

    if (Format >= TEX_FORMAT_UNKNOWN && Format < TEX_FORMAT_NUM_FORMATS)
    {
        return FmtAttribs[Format];
    }
    else
    {
        UNEXPECTED("Texture format (", int{Format}, ") is out of allowed range [0, ", int{TEX_FORMAT_NUM_FORMATS} - 1, "]");
        return FmtAttribs[0];
    }
}

TEXTURE_FORMAT RenderTextureFormatToTextureFormat(RENDER_TEXTURE_FORMAT RenderFormat)
{
    static_assert(RTF_NUM_FORMATS == 15, "Please update the switch below to handle the new render texture format");
    switch (RenderFormat)
    {
        // clang-format off
        case RTF_ARGB32:          return TEX_FORMAT_RGBA8_UNORM;
        case RTF_ARGB_HALF:       return TEX_FORMAT_RGBA16_FLOAT;
        case RTF_ARGB_FLOAT:      return TEX_FORMAT_RGBA32_FLOAT;
        case RTF_ARGB_INT:        return TEX_FORMAT_RGBA32_SINT;
        case RTF_RGBA_USHORT:     return TEX_FORMAT_RGBA16_UNORM;
        case RTF_RGB111110_FLOAT: return TEX_FORMAT_R11G11B10_FLOAT;
        case RTF_RG_FLOAT:        return TEX_FORMAT_RG32_FLOAT;
        case RTF_RG_HALF:         return TEX_FORMAT_RG16_FLOAT;
        case RTF_RG_INT:          return TEX_FORMAT_RG32_SINT;
        case RTF_R_FLOAT:         return TEX_FORMAT_R32_FLOAT;
        case RTF_R_HALF:          return TEX_FORMAT_R16_FLOAT;
        case RTF_R_INT:           return TEX_FORMAT_R32_SINT;
        case RTF_R8:              return TEX_FORMAT_R8_UNORM;
        case RTF_R16:             return TEX_FORMAT_R16_UNORM;
        // clang-format on
        default:
            return TEX_FORMAT_UNKNOWN;
    }
}

RENDER_TEXTURE_FORMAT TextureFormatToRenderTextureFormat(TEXTURE_FORMAT Format)
{
    static const std::array<RENDER_TEXTURE_FORMAT, TEX_FORMAT_NUM_FORMATS> RenderFormats = []() {
        std::array<RENDER_TEXTURE_FORMAT, TEX_FORMAT_NUM_FORMATS> Formats;
        Formats.fill(RTF_UNDEFINED);
        for (Uint32 RTF = RTF_UNDEFINED + 1; RTF < RTF_NUM_FORMATS; ++RTF)
        {
            const auto TexFmt = RenderTextureFormatToTextureFormat(static_cast<RENDER_TEXTURE_FORMAT>(RTF));
            VERIFY(Formats[TexFmt] == RTF_UNDEFINED, "Texture format ", GetTextureFormatAttribs(TexFmt).Name, " is backing more than one render texture format");
            Formats[TexFmt] = static_cast<RENDER_TEXTURE_FORMAT>(RTF);
        }
        return Formats;
    }();

    return Format < TEX_FORMAT_NUM_FORMATS ? RenderFormats[Format] : RTF_UNDEFINED;
}

const Char* GetRenderTextureFormatString(RENDER_TEXTURE_FORMAT RenderFormat)
{
    static_assert(RTF_NUM_FORMATS == 15, "Please update the switch below to handle the new render texture format");
    switch (RenderFormat)
    {
#define RTF_TO_STR(Fmt) \
    case Fmt: return #Fmt

        RTF_TO_STR(RTF_UNDEFINED);
        RTF_TO_STR(RTF_ARGB32);
        RTF_TO_STR(RTF_ARGB_HALF);
        RTF_TO_STR(RTF_ARGB_FLOAT);
        RTF_TO_STR(RTF_ARGB_INT);
        RTF_TO_STR(RTF_RGBA_USHORT);
        RTF_TO_STR(RTF_RGB111110_FLOAT);
        RTF_TO_STR(RTF_RG_FLOAT);
        RTF_TO_STR(RTF_RG_HALF);
        RTF_TO_STR(RTF_RG_INT);
        RTF_TO_STR(RTF_R_FLOAT);
        RTF_TO_STR(RTF_R_HALF);
        RTF_TO_STR(RTF_R_INT);
        RTF_TO_STR(RTF_R8);
        RTF_TO_STR(RTF_R16);
#undef RTF_TO_STR

        default:
            UNEXPECTED("Unexpected render texture format (", int{RenderFormat}, ")");
            return "Unknown render texture format";
    }
}

const Char* GetComputeBufferTypeString(COMPUTE_BUFFER_TYPE Type)
{
    static const Char* TypeStrings[COMPUTE_BUFFER_TYPE_NUM_TYPES];
    static bool        bIsInit = false;
    if (!bIsInit)
    {
        // clang-format off
#define INIT_COMPUTE_BUFFER_TYPE_STR(Type) TypeStrings[Type] = #Type
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_DEFAULT);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_RAW);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_APPEND);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_COUNTER);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_CONSTANT);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_STRUCTURED);
        INIT_COMPUTE_BUFFER_TYPE_STR(COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS);
#undef INIT_COMPUTE_BUFFER_TYPE_STR
        // clang-format on
        static_assert(COMPUTE_BUFFER_TYPE_NUM_TYPES == COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS + 1, "Not all compute buffer type strings initialized.");
        bIsInit = true;
    }
    if (Type >= COMPUTE_BUFFER_TYPE_DEFAULT && Type < COMPUTE_BUFFER_TYPE_NUM_TYPES)
        return TypeStrings[Type];
    else
    {
        UNEXPECTED("Unknown compute buffer type (", int{Type}, ")");
        return "Unknown compute buffer type";
    }
}

const Char* GetBufferModeString(BUFFER_MODE Mode)
{
    static_assert(BUFFER_MODE_NUM_MODES == 3, "Please update the switch below to handle the new buffer mode");
    switch (Mode)
    {
        // clang-format off
        case BUFFER_MODE_UNDEFINED:  return "BUFFER_MODE_UNDEFINED";
        case BUFFER_MODE_STRUCTURED: return "BUFFER_MODE_STRUCTURED";
        case BUFFER_MODE_RAW:        return "BUFFER_MODE_RAW";
        // clang-format on
        default:
            UNEXPECTED("Unknown buffer mode (", int{Mode}, ")");
            return "Unknown buffer mode";
    }
}

const Char* GetResourceDimString(RESOURCE_DIMENSION ResourceDim)
{
    static_assert(RESOURCE_DIM_NUM_DIMENSIONS == 4, "Please update the switch below to handle the new resource dimension");
    switch (ResourceDim)
    {
        // clang-format off
        case RESOURCE_DIM_UNDEFINED: return "Undefined";
        case RESOURCE_DIM_BUFFER:    return "Buffer";
        case RESOURCE_DIM_TEX_2D:    return "Texture 2D";
        case RESOURCE_DIM_TEX_3D:    return "Texture 3D";
        // clang-format on
        default:
            UNEXPECTED("Unknown resource dimension (", int{ResourceDim}, ")");
            return "Unknown resource dimension";
    }
}

const Char* GetBindFlagString(Uint32 BindFlag)
{
    VERIFY((BindFlag & (BindFlag - 1)) == 0, "More than one bind flag is specified");
    static_assert(BIND_FLAG_LAST == 0x8, "Please update the switch below to handle the new bind flag");
    switch (BindFlag)
    {
#define BIND_FLAG_STR_CASE(Flag) \
    case Flag: return #Flag;

        BIND_FLAG_STR_CASE(BIND_NONE)
        BIND_FLAG_STR_CASE(BIND_UNIFORM_BUFFER)
        BIND_FLAG_STR_CASE(BIND_SHADER_RESOURCE)
        BIND_FLAG_STR_CASE(BIND_UNORDERED_ACCESS)
        BIND_FLAG_STR_CASE(BIND_INDIRECT_DRAW_ARGS)
#undef BIND_FLAG_STR_CASE
        default: UNEXPECTED("Unexpected bind flag ", BindFlag); return "";
    }
}

String GetBindFlagsString(Uint32 BindFlags, const Char* Delimiter)
{
    if (BindFlags == 0)
        return "0";

    String Str;
    for (Uint32 Flag = BIND_UNIFORM_BUFFER; BindFlags && Flag <= BIND_FLAG_LAST; Flag <<= 1)
    {
        if (BindFlags & Flag)
        {
            if (!Str.empty())
                Str += Delimiter;
            Str += GetBindFlagString(Flag);
            BindFlags &= ~Flag;
        }
    }
    VERIFY(BindFlags == 0, "Unknown bind flags left");
    return Str;
}

String GetBufferDescString(const BufferDesc& Desc)
{
    String Str;
    Str += "Size: ";
    Str += std::to_string(Desc.Size);
    Str += "; stride: ";
    Str += std::to_string(Desc.ElementByteStride);
    Str += "; type: ";
    Str += GetComputeBufferTypeString(Desc.ComputeType);
    Str += "; mode: ";
    Str += GetBufferModeString(Desc.Mode);
    Str += "; bind flags: ";
    Str += GetBindFlagsString(Desc.BindFlags);
    return Str;
}

String GetTextureDescString(const TextureDesc& Desc)
{
    String Str = "Type: ";
    Str += GetResourceDimString(Desc.Type);
    Str += "; size: ";
    Str += std::to_string(Desc.Width);
    if (Desc.Type == RESOURCE_DIM_TEX_2D || Desc.Type == RESOURCE_DIM_TEX_3D)
    {
        Str += "x";
        Str += std::to_string(Desc.Height);
    }
    if (Desc.Type == RESOURCE_DIM_TEX_3D)
    {
        Str += "x";
        Str += std::to_string(Desc.Depth);
    }
    Str += "; format: ";
    Str += GetTextureFormatAttribs(Desc.Format).Name;
    if (Desc.RenderFormat != RTF_UNDEFINED)
    {
        Str += " (";
        Str += GetRenderTextureFormatString(Desc.RenderFormat);
        Str += ")";
    }
    Str += "; mip levels: ";
    Str += std::to_string(Desc.MipLevels);
    Str += "; sample count: ";
    Str += std::to_string(Desc.SampleCount);
    Str += "; bind flags: ";
    Str += GetBindFlagsString(Desc.BindFlags);
    return Str;
}

Uint32 GetBufferElementCount(const BufferDesc& Desc)
{
    return Desc.ElementByteStride != 0 ?
        static_cast<Uint32>(Desc.Size / Desc.ElementByteStride) :
        0;
}

Uint64 GetTextureDataSize(const TextureDesc& Desc)
{
    const auto ElementSize = Uint64{GetTextureFormatAttribs(Desc.Format).GetElementSize()};

    Uint64 DataSize = 0;
    for (Uint32 Mip = 0; Mip < Desc.MipLevels; ++Mip)
    {
        const auto MipWidth  = Uint64{std::max(Desc.Width >> Mip, 1u)};
        const auto MipHeight = Uint64{std::max(Desc.Height >> Mip, 1u)};
        const auto MipDepth  = Desc.Type == RESOURCE_DIM_TEX_3D ? Uint64{std::max(Desc.Depth >> Mip, 1u)} : Uint64{1};
        DataSize += MipWidth * MipHeight * MipDepth * ElementSize;
    }
    return DataSize;
}

} // namespace Bindery

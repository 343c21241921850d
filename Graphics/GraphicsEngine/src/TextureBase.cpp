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


#include "TextureBase.hpp"

#include <algorithm>

#include "GraphicsAccessories.hpp"

namespace Bindery
{

#define LOG_TEXTURE_ERROR_AND_THROW(...) LOG_ERROR_AND_THROW("Texture '", (Desc.Name ? Desc.Name : ""), "': ", ##__VA_ARGS__)
#define VERIFY_TEXTURE(Expr, ...)                     \
    do                                                \
    {                                                 \
        if (!(Expr))                                  \
        {                                             \
            LOG_TEXTURE_ERROR_AND_THROW(__VA_ARGS__); \
        }                                             \
    } while (false)

void ValidateTextureDesc(const TextureDesc& Desc) noexcept(false)
{
    VERIFY_TEXTURE(Desc.Type == RESOURCE_DIM_TEX_2D || Desc.Type == RESOURCE_DIM_TEX_3D,
                   "resource dimension ", GetResourceDimString(Desc.Type), " is not a valid texture type.");

    VERIFY_TEXTURE(Desc.Width != 0, "texture width cannot be zero.");
    VERIFY_TEXTURE(Desc.Height != 0, "texture height cannot be zero.");
    VERIFY_TEXTURE(Desc.Depth != 0, "texture depth cannot be zero.");
    if (Desc.Type == RESOURCE_DIM_TEX_2D)
    {
        VERIFY_TEXTURE(Desc.Depth == 1, "depth (", Desc.Depth, ") must be 1 for a 2D texture.");
        VERIFY_TEXTURE(Desc.Width <= MAX_TEXTURE_2D_DIMENSION && Desc.Height <= MAX_TEXTURE_2D_DIMENSION,
                       "dimensions (", Desc.Width, " x ", Desc.Height, ") exceed the maximum 2D texture dimension (", MAX_TEXTURE_2D_DIMENSION, ").");
    }
    else
    {
        VERIFY_TEXTURE(Desc.Width <= MAX_TEXTURE_3D_DIMENSION && Desc.Height <= MAX_TEXTURE_3D_DIMENSION && Desc.Depth <= MAX_TEXTURE_3D_DIMENSION,
                       "dimensions (", Desc.Width, " x ", Desc.Height, " x ", Desc.Depth, ") exceed the maximum 3D texture dimension (", MAX_TEXTURE_3D_DIMENSION, ").");
    }

    VERIFY_TEXTURE(Desc.Format > TEX_FORMAT_UNKNOWN && Desc.Format < TEX_FORMAT_NUM_FORMATS, "texture format (", Uint32{Desc.Format}, ") is invalid.");

    if (Desc.RenderFormat != RTF_UNDEFINED)
    {
        VERIFY_TEXTURE(Desc.RenderFormat < RTF_NUM_FORMATS, "render texture format (", Uint32{Desc.RenderFormat}, ") is invalid.");
        VERIFY_TEXTURE(RenderTextureFormatToTextureFormat(Desc.RenderFormat) == Desc.Format,
                       "render texture format ", GetRenderTextureFormatString(Desc.RenderFormat), " is not backed by ",
                       GetTextureFormatAttribs(Desc.Format).Name, '.');
    }

    VERIFY_TEXTURE(Desc.MipLevels != 0, "number of mip levels cannot be zero.");
    VERIFY_TEXTURE(Desc.MipLevels <= 32, "too many mip levels (", Desc.MipLevels, ").");
    {
        Uint32 MaxDim = std::max(Desc.Width, Desc.Height);
        if (Desc.Type == RESOURCE_DIM_TEX_3D)
            MaxDim = std::max(MaxDim, Desc.Depth);
        VERIFY_TEXTURE(MaxDim >= (1U << (Desc.MipLevels - 1)), "too many mip levels (", Desc.MipLevels, ").");
    }

    VERIFY_TEXTURE(Desc.SampleCount == 1, "only single-sampled textures are supported, requested sample count is ", Desc.SampleCount, '.');

    VERIFY_TEXTURE(Desc.AddressMode > TEXTURE_ADDRESS_UNKNOWN && Desc.AddressMode < TEXTURE_ADDRESS_NUM_MODES,
                   "address mode (", Uint32{Desc.AddressMode}, ") is invalid.");

    constexpr Uint32 AllowedBindFlags = BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS;
    VERIFY_TEXTURE((Desc.BindFlags & ~AllowedBindFlags) == 0, "the following bind flags are not allowed for a texture: ",
                   GetBindFlagsString(Desc.BindFlags & ~AllowedBindFlags, ", "), '.');
}

#undef VERIFY_TEXTURE
#undef LOG_TEXTURE_ERROR_AND_THROW

} // namespace Bindery

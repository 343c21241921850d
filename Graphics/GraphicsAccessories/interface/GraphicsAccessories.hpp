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
/// Defines graphics engine utilities

#include "../../GraphicsEngine/interface/GraphicsTypes.h"
#include "../../GraphicsEngine/interface/Buffer.h"
#include "../../GraphicsEngine/interface/Texture.h"

namespace Bindery
{

/// Returns invariant texture format attributes, see TextureFormatAttribs for details.

/// \param [in] Format - Texture format which attributes are requested for.
/// \return Constant reference to the TextureFormatAttribs structure containing
///         format attributes. Unknown formats return the attributes of TEX_FORMAT_UNKNOWN.
const TextureFormatAttribs& GetTextureFormatAttribs(TEXTURE_FORMAT Format);

/// Returns the texture format that backs the render texture format.

/// Every valid render texture format maps to exactly one texture format.
/// RTF_UNDEFINED and out-of-range values map to TEX_FORMAT_UNKNOWN.
TEXTURE_FORMAT RenderTextureFormatToTextureFormat(RENDER_TEXTURE_FORMAT RenderFormat);

/// Returns the render texture format backed by the texture format,
/// or RTF_UNDEFINED if no render texture format maps to it.
RENDER_TEXTURE_FORMAT TextureFormatToRenderTextureFormat(TEXTURE_FORMAT Format);

/// Returns the literal name of the render texture format (e.g. "RTF_ARGB_HALF")
const Char* GetRenderTextureFormatString(RENDER_TEXTURE_FORMAT RenderFormat);

/// Returns the literal name of the compute buffer type (e.g. "COMPUTE_BUFFER_TYPE_RAW")
const Char* GetComputeBufferTypeString(COMPUTE_BUFFER_TYPE Type);

/// Returns the literal name of the buffer mode (e.g. "BUFFER_MODE_STRUCTURED")
const Char* GetBufferModeString(BUFFER_MODE Mode);

/// Returns the literal name of the resource dimension (e.g. "Texture 3D")
const Char* GetResourceDimString(RESOURCE_DIMENSION ResourceDim);

/// Returns the literal name of a single bind flag (e.g. "BIND_UNORDERED_ACCESS")
const Char* GetBindFlagString(Uint32 BindFlag);

/// Returns the string containing the names of all set bind flags joined by the delimiter
String GetBindFlagsString(Uint32 BindFlags, const Char* Delimiter = "|");

/// Returns the string describing the buffer: size, stride, type, mode and bind flags
String GetBufferDescString(const BufferDesc& Desc);

/// Returns the string describing the texture: type, dimensions, format and bind flags
String GetTextureDescString(const TextureDesc& Desc);

/// Returns the number of elements in the buffer, Size / ElementByteStride
Uint32 GetBufferElementCount(const BufferDesc& Desc);

/// Returns the size of the texture memory including all mip levels, in bytes
Uint64 GetTextureDataSize(const TextureDesc& Desc);

} // namespace Bindery

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


#include "ComputeResources.hpp"

#include "GraphicsAccessories.hpp"
#include "DebugUtilities.hpp"

namespace Bindery
{

BufferDesc BuildComputeBufferDesc(const Char* Name, Uint32 Count, Uint32 Stride, COMPUTE_BUFFER_TYPE Type)
{
    BufferDesc Desc;
    Desc.Name              = Name;
    Desc.Size              = Uint64{Count} * Uint64{Stride};
    Desc.ElementByteStride = Stride;
    Desc.ComputeType       = Type;

    static_assert(COMPUTE_BUFFER_TYPE_NUM_TYPES == 7, "Please update the switch below to handle the new compute buffer type");
    switch (Type)
    {
        case COMPUTE_BUFFER_TYPE_CONSTANT:
            Desc.BindFlags = BIND_UNIFORM_BUFFER;
            Desc.Mode      = BUFFER_MODE_UNDEFINED;
            break;

        case COMPUTE_BUFFER_TYPE_RAW:
            Desc.BindFlags = BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS;
            Desc.Mode      = BUFFER_MODE_RAW;
            break;

        case COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS:
            Desc.BindFlags = BIND_UNORDERED_ACCESS | BIND_INDIRECT_DRAW_ARGS;
            Desc.Mode      = BUFFER_MODE_RAW;
            break;

        case COMPUTE_BUFFER_TYPE_DEFAULT:
        case COMPUTE_BUFFER_TYPE_APPEND:
        case COMPUTE_BUFFER_TYPE_COUNTER:
        case COMPUTE_BUFFER_TYPE_STRUCTURED:
            Desc.BindFlags = BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS;
            Desc.Mode      = BUFFER_MODE_STRUCTURED;
            break;

        default:
            UNEXPECTED("Unexpected compute buffer type");
    }

    return Desc;
}

TextureDesc BuildVolumeDesc(const Char* Name, Uint32 Cells, TEXTURE_FORMAT Format)
{
    TextureDesc Desc;
    Desc.Name         = Name;
    Desc.Type         = RESOURCE_DIM_TEX_3D;
    Desc.Width        = Cells;
    Desc.Height       = Cells;
    Desc.Depth        = Cells;
    Desc.Format       = Format;
    Desc.RenderFormat = TextureFormatToRenderTextureFormat(Format);
    Desc.MipLevels    = 1;
    Desc.SampleCount  = 1;
    Desc.BindFlags    = BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS;
    Desc.AddressMode  = TEXTURE_ADDRESS_CLAMP;
    Desc.Lifetime     = RESOURCE_LIFETIME_EXPLICIT;
    return Desc;
}

TextureDesc BuildVolumeDesc(const Char* Name, Uint32 Cells, RENDER_TEXTURE_FORMAT Format)
{
    TextureDesc Desc  = BuildVolumeDesc(Name, Cells, RenderTextureFormatToTextureFormat(Format));
    Desc.RenderFormat = Format;
    return Desc;
}

bool IsBufferReusable(const IBuffer* pBuffer, Uint32 Count, Uint32 Stride)
{
    if (pBuffer == nullptr || !pBuffer->IsValid())
        return false;

    const auto& Desc = pBuffer->GetDesc();
    return Desc.ElementByteStride == Stride && GetBufferElementCount(Desc) == Count;
}

namespace
{

bool IsCubicVolume(const TextureDesc& Desc, Uint32 Cells)
{
    return Desc.Type == RESOURCE_DIM_TEX_3D && Desc.Width == Cells && Desc.Height == Cells && Desc.Depth == Cells;
}

} // namespace

bool IsVolumeReusable(const ITexture* pVolume, Uint32 Cells, RENDER_TEXTURE_FORMAT Format)
{
    if (pVolume == nullptr || !pVolume->IsValid())
        return false;

    const auto& Desc = pVolume->GetDesc();
    return IsCubicVolume(Desc, Cells) && Desc.RenderFormat == Format;
}

bool IsVolumeReusable(const ITexture* pVolume, Uint32 Cells, TEXTURE_FORMAT Format)
{
    if (pVolume == nullptr || !pVolume->IsValid())
        return false;

    const auto& Desc = pVolume->GetDesc();
    return IsCubicVolume(Desc, Cells) && Desc.Format == Format;
}


ComputeResourceManager::ComputeResourceManager(IRenderDevice* pDevice) :
    m_pDevice{pDevice}
{
    if (m_pDevice == nullptr)
        LOG_ERROR_AND_THROW("Render device must not be null");
}

bool ComputeResourceManager::CreateBuffer(RefCntAutoPtr<IBuffer>& pBuffer,
                                          const Char*             Name,
                                          Uint32                  Count,
                                          Uint32                  Stride,
                                          COMPUTE_BUFFER_TYPE     Type) noexcept(false)
{
    if (Name == nullptr)
        Name = "";

    if (IsBufferReusable(pBuffer, Count, Stride))
        return false;

    if (pBuffer)
    {
        const auto& OldDesc = pBuffer->GetDesc();
        if (!pBuffer->IsValid())
            LOG_INFO_MESSAGE("Recreating buffer '", Name, "': the existing buffer is no longer valid");
        else
            LOG_INFO_MESSAGE("Recreating buffer '", Name, "': ", GetBufferElementCount(OldDesc), " x ", OldDesc.ElementByteStride,
                             " bytes -> ", Count, " x ", Stride, " bytes");
        pBuffer.Release();
    }
    else
    {
        LOG_INFO_MESSAGE("Creating buffer '", Name, "': ", Count, " x ", Stride, " bytes, ", GetComputeBufferTypeString(Type));
    }

    const auto Desc = BuildComputeBufferDesc(Name, Count, Stride, Type);
    m_pDevice->CreateBuffer(Desc, nullptr, &pBuffer);
    if (!pBuffer)
        LOG_ERROR_AND_THROW("Failed to allocate buffer '", Name, "' (", Count, " x ", Stride, " bytes)");

    return true;
}

void ComputeResourceManager::ReleaseBuffer(RefCntAutoPtr<IBuffer>& pBuffer)
{
    pBuffer.Release();
}

bool ComputeResourceManager::RecreateVolume(RefCntAutoPtr<ITexture>& pVolume, const TextureDesc& VolumeDesc, bool IsReusable)
{
    if (IsReusable)
        return false;

    if (pVolume)
    {
        if (!pVolume->IsValid())
            LOG_INFO_MESSAGE("Recreating volume '", VolumeDesc.Name, "': the existing volume is no longer valid");
        else
            LOG_INFO_MESSAGE("Recreating volume '", VolumeDesc.Name, "': ", GetTextureDescString(pVolume->GetDesc()), " -> ", GetTextureDescString(VolumeDesc));
        pVolume.Release();
    }
    else
    {
        LOG_INFO_MESSAGE("Creating volume '", VolumeDesc.Name, "': ", GetTextureDescString(VolumeDesc));
    }

    m_pDevice->CreateTexture(VolumeDesc, &pVolume);
    if (!pVolume)
        LOG_ERROR_AND_THROW("Failed to allocate volume '", VolumeDesc.Name, "' (", VolumeDesc.Width, "^3 cells)");

    return true;
}

bool ComputeResourceManager::CreateVolume(RefCntAutoPtr<ITexture>& pVolume,
                                          const Char*              Name,
                                          Uint32                   Cells,
                                          RENDER_TEXTURE_FORMAT    Format) noexcept(false)
{
    if (Name == nullptr)
        Name = "";

    return RecreateVolume(pVolume, BuildVolumeDesc(Name, Cells, Format), IsVolumeReusable(pVolume, Cells, Format));
}

bool ComputeResourceManager::CreateVolume(RefCntAutoPtr<ITexture>& pVolume,
                                          const Char*              Name,
                                          Uint32                   Cells,
                                          TEXTURE_FORMAT           Format) noexcept(false)
{
    if (Name == nullptr)
        Name = "";

    return RecreateVolume(pVolume, BuildVolumeDesc(Name, Cells, Format), IsVolumeReusable(pVolume, Cells, Format));
}

void ComputeResourceManager::ReleaseVolume(RefCntAutoPtr<ITexture>& pVolume)
{
    pVolume.Release();
}

} // namespace Bindery

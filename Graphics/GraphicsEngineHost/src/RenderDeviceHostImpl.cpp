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


#include "RenderDeviceHostImpl.hpp"

#include "BufferHostImpl.hpp"
#include "TextureHostImpl.hpp"
#include "ShaderProgramHostImpl.hpp"
#include "MaterialHostImpl.hpp"
#include "ShaderGlobalsHostImpl.hpp"

namespace Bindery
{

RenderDeviceHostImpl::RenderDeviceHostImpl(const EngineHostCreateInfo& EngineCI) :
    m_EngineCI{EngineCI},
    m_pShaderGlobals{new ShaderGlobalsHostImpl}
{
}

RenderDeviceHostImpl::~RenderDeviceHostImpl()
{
    // Global bindings may hold the last references to buffers and textures that
    // unregister themselves from this device when they are destroyed.
    m_pShaderGlobals.Release();

    VERIFY(m_Buffers.empty(), "Buffers outlive the device that created them: ", m_Buffers.size());
    VERIFY(m_Textures.empty(), "Textures outlive the device that created them: ", m_Textures.size());
}

IMPLEMENT_QUERY_INTERFACE(RenderDeviceHostImpl, IID_RenderDeviceHost, TRenderDeviceBase)

void RenderDeviceHostImpl::CreateBuffer(const BufferDesc& BuffDesc, const BufferData* pBuffData, IBuffer** ppBuffer)
{
    CreateDeviceObject("buffer", BuffDesc, ppBuffer,
                       [&]() //
                       {
                           BufferHostImpl* pBufferHost = new BufferHostImpl{this, BuffDesc, pBuffData};
                           pBufferHost->QueryInterface(IID_Buffer, reinterpret_cast<IObject**>(ppBuffer));
                       });
}

void RenderDeviceHostImpl::CreateTexture(const TextureDesc& TexDesc, ITexture** ppTexture)
{
    CreateDeviceObject("texture", TexDesc, ppTexture,
                       [&]() //
                       {
                           TextureHostImpl* pTextureHost = new TextureHostImpl{this, TexDesc};
                           pTextureHost->QueryInterface(IID_Texture, reinterpret_cast<IObject**>(ppTexture));
                       });
}

void RenderDeviceHostImpl::CreateShaderProgram(const ShaderProgramDesc& ProgramDesc, IShaderProgram** ppProgram)
{
    CreateDeviceObject("shader program", ProgramDesc, ppProgram,
                       [&]() //
                       {
                           ShaderProgramHostImpl* pProgramHost = new ShaderProgramHostImpl{this, ProgramDesc};
                           pProgramHost->QueryInterface(IID_ShaderProgram, reinterpret_cast<IObject**>(ppProgram));
                       });
}

void RenderDeviceHostImpl::CreateMaterial(const MaterialDesc& MtrlDesc, IMaterial** ppMaterial)
{
    CreateDeviceObject("material", MtrlDesc, ppMaterial,
                       [&]() //
                       {
                           MaterialHostImpl* pMaterialHost = new MaterialHostImpl{this, MtrlDesc};
                           pMaterialHost->QueryInterface(IID_Material, reinterpret_cast<IObject**>(ppMaterial));
                       });
}

IShaderGlobals* RenderDeviceHostImpl::GetShaderGlobals()
{
    return m_pShaderGlobals;
}

void RenderDeviceHostImpl::AllocateDeviceMemory(Uint64 Size, const Char* ResourceName) noexcept(false)
{
    const auto Budget = m_EngineCI.DeviceMemoryBudget;
    if (Budget != 0 && (Size > Budget || m_MemoryStats.AllocatedBytes > Budget - Size))
    {
        LOG_ERROR_AND_THROW("Out of device memory: allocating ", Size, " bytes for '", ResourceName, "' would exceed the budget of ",
                            Budget, " bytes (", m_MemoryStats.AllocatedBytes, " bytes are in use).");
    }
    m_MemoryStats.AllocatedBytes += Size;
}

void RenderDeviceHostImpl::FreeDeviceMemory(Uint64 Size)
{
    VERIFY(m_MemoryStats.AllocatedBytes >= Size, "Freeing more device memory than was allocated");
    m_MemoryStats.AllocatedBytes -= Size;
}

void RenderDeviceHostImpl::OnCreateBuffer(BufferHostImpl* pBuffer)
{
    VERIFY_EXPR(m_Buffers.find(pBuffer) == m_Buffers.end());
    m_Buffers.insert(pBuffer);
    m_MemoryStats.NumBuffers = static_cast<Uint32>(m_Buffers.size());
    ++m_MemoryStats.NumBufferAllocations;
}

void RenderDeviceHostImpl::OnDestroyBuffer(BufferHostImpl* pBuffer)
{
    VERIFY(m_Buffers.find(pBuffer) != m_Buffers.end(), "Buffer is not registered");
    m_Buffers.erase(pBuffer);
    m_MemoryStats.NumBuffers = static_cast<Uint32>(m_Buffers.size());
}

void RenderDeviceHostImpl::OnCreateTexture(TextureHostImpl* pTexture)
{
    VERIFY_EXPR(m_Textures.find(pTexture) == m_Textures.end());
    m_Textures.insert(pTexture);
    m_MemoryStats.NumTextures = static_cast<Uint32>(m_Textures.size());
    ++m_MemoryStats.NumTextureAllocations;
}

void RenderDeviceHostImpl::OnDestroyTexture(TextureHostImpl* pTexture)
{
    VERIFY(m_Textures.find(pTexture) != m_Textures.end(), "Texture is not registered");
    m_Textures.erase(pTexture);
    m_MemoryStats.NumTextures = static_cast<Uint32>(m_Textures.size());
}

void RenderDeviceHostImpl::InvalidateResources()
{
    for (auto* pBuffer : m_Buffers)
        pBuffer->Invalidate();
    for (auto* pTexture : m_Textures)
        pTexture->Invalidate();

    LOG_WARNING_MESSAGE("Device storage of ", m_Buffers.size(), " buffer(s) and ", m_Textures.size(), " texture(s) has been lost");
}

void RenderDeviceHostImpl::ReleaseTrackedResources()
{
    Uint32 NumReleased = 0;
    for (auto* pTexture : m_Textures)
    {
        if (pTexture->GetDesc().Lifetime == RESOURCE_LIFETIME_TRACKED && pTexture->IsValid())
        {
            pTexture->Invalidate();
            ++NumReleased;
        }
    }

    if (NumReleased > 0)
        LOG_INFO_MESSAGE("Released storage of ", NumReleased, " tracked texture(s)");
}

} // namespace Bindery

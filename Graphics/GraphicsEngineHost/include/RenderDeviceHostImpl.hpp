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
/// Declaration of Bindery::RenderDeviceHostImpl class

#include <unordered_set>

#include "RenderDeviceHost.h"
#include "EngineFactoryHost.h"
#include "RenderDeviceBase.hpp"
#include "RefCntAutoPtr.hpp"

namespace Bindery
{

class BufferHostImpl;
class TextureHostImpl;
class ShaderGlobalsHostImpl;

/// Render device implementation in the host-memory backend.
class RenderDeviceHostImpl final : public RenderDeviceBase<IRenderDeviceHost>
{
public:
    using TRenderDeviceBase = RenderDeviceBase<IRenderDeviceHost>;

    explicit RenderDeviceHostImpl(const EngineHostCreateInfo& EngineCI);
    ~RenderDeviceHostImpl();

    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override final;

    /// Implementation of IRenderDevice::CreateBuffer() in the host backend.
    virtual void CreateBuffer(const BufferDesc& BuffDesc,
                              const BufferData* pBuffData,
                              IBuffer**         ppBuffer) override final;

    /// Implementation of IRenderDevice::CreateTexture() in the host backend.
    virtual void CreateTexture(const TextureDesc& TexDesc,
                               ITexture**         ppTexture) override final;

    /// Implementation of IRenderDevice::CreateShaderProgram() in the host backend.
    virtual void CreateShaderProgram(const ShaderProgramDesc& ProgramDesc,
                                     IShaderProgram**         ppProgram) override final;

    /// Implementation of IRenderDevice::CreateMaterial() in the host backend.
    virtual void CreateMaterial(const MaterialDesc& MtrlDesc,
                                IMaterial**         ppMaterial) override final;

    virtual IShaderGlobals* GetShaderGlobals() override final;

    /// Implementation of IRenderDeviceHost::GetMemoryStats().
    virtual const DeviceMemoryStats& GetMemoryStats() const override final { return m_MemoryStats; }

    /// Implementation of IRenderDeviceHost::GetDeviceMemoryBudget().
    virtual Uint64 GetDeviceMemoryBudget() const override final { return m_EngineCI.DeviceMemoryBudget; }

    /// Implementation of IRenderDeviceHost::InvalidateResources().
    virtual void InvalidateResources() override final;

    /// Implementation of IRenderDeviceHost::ReleaseTrackedResources().
    virtual void ReleaseTrackedResources() override final;

    const EngineHostCreateInfo& GetEngineCreateInfo() const { return m_EngineCI; }

    /// Reserves device memory for a resource. Throws if the budget would be exceeded.
    void AllocateDeviceMemory(Uint64 Size, const Char* ResourceName) noexcept(false);

    /// Returns device memory reserved by AllocateDeviceMemory()
    void FreeDeviceMemory(Uint64 Size);

    void OnCreateBuffer(BufferHostImpl* pBuffer);
    void OnDestroyBuffer(BufferHostImpl* pBuffer);
    void OnCreateTexture(TextureHostImpl* pTexture);
    void OnDestroyTexture(TextureHostImpl* pTexture);

private:
    const EngineHostCreateInfo m_EngineCI;

    DeviceMemoryStats m_MemoryStats;

    // The registries hold raw pointers. This is safe because every
    // object unregisters itself when it is destroyed.
    std::unordered_set<BufferHostImpl*>  m_Buffers;
    std::unordered_set<TextureHostImpl*> m_Textures;

    RefCntAutoPtr<ShaderGlobalsHostImpl> m_pShaderGlobals;
};

} // namespace Bindery

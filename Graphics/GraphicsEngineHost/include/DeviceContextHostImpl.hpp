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
/// Declaration of Bindery::DeviceContextHostImpl class

#include <vector>

#include "DeviceContextBase.hpp"
#include "RenderDeviceHostImpl.hpp"
#include "HostCommand.hpp"

namespace Bindery
{

/// Device context implementation in the host-memory backend.

/// The immediate context executes commands right away. A deferred context
/// records them until FinishCommandList() is called.
class DeviceContextHostImpl final : public DeviceContextBase<IDeviceContext, RenderDeviceHostImpl>
{
public:
    using TDeviceContextBase = DeviceContextBase<IDeviceContext, RenderDeviceHostImpl>;

    DeviceContextHostImpl(RenderDeviceHostImpl* pDevice, const DeviceContextDesc& Desc);

    /// Implementation of IDeviceContext::UpdateBuffer() in the host backend.
    virtual void UpdateBuffer(IBuffer*    pBuffer,
                              Uint64      Offset,
                              Uint64      Size,
                              const void* pData) override final;

    virtual void SetProgramConstantBuffer(IShaderProgram*  pProgram,
                                          ShaderPropertyID Slot,
                                          IBuffer*         pBuffer,
                                          Uint32           Offset,
                                          Uint32           Size) override final;

    virtual void SetProgramBuffer(IShaderProgram*  pProgram,
                                  Uint32           Kernel,
                                  ShaderPropertyID Slot,
                                  IBuffer*         pBuffer) override final;

    virtual void SetProgramTexture(IShaderProgram*  pProgram,
                                   Uint32           Kernel,
                                   ShaderPropertyID Slot,
                                   ITexture*        pTexture) override final;

    virtual void SetProgramKeyword(IShaderProgram* pProgram, const Char* Name, bool Enable) override final;

    virtual void SetGlobalConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) override final;

    virtual void SetGlobalBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) override final;

    virtual void SetGlobalTexture(ShaderPropertyID Slot, ITexture* pTexture) override final;

    virtual void SetGlobalKeyword(const Char* Name, bool Enable) override final;

    /// Implementation of IDeviceContext::FinishCommandList() in the host backend.
    virtual void FinishCommandList(ICommandList** ppCommandList) override final;

    /// Implementation of IDeviceContext::ExecuteCommandList() in the host backend.
    virtual void ExecuteCommandList(ICommandList* pCommandList) override final;

    /// Returns the number of commands recorded since the last FinishCommandList()
    size_t GetNumRecordedCommands() const { return m_RecordedCommands.size(); }

private:
    /// Records the command in a deferred context or executes it in the immediate one
    void Submit(HostCommand&& Cmd);

    void ExecuteCommand(HostCommand& Cmd);

    bool ValidationEnabled() const;

    std::vector<HostCommand> m_RecordedCommands;

    Uint32 m_NumCommandLists = 0;
};

} // namespace Bindery

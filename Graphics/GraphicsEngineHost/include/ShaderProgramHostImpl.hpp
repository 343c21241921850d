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
/// Declaration of Bindery::ShaderProgramHostImpl class

#include <vector>

#include "ShaderProgramHost.h"
#include "DeviceObjectBase.hpp"
#include "RenderDeviceHostImpl.hpp"

namespace Bindery
{

/// Shader program object implementation in the host-memory backend.
class ShaderProgramHostImpl final : public DeviceObjectBase<IShaderProgramHost, RenderDeviceHostImpl, ShaderProgramDesc>
{
public:
    using TDeviceObjectBase = DeviceObjectBase<IShaderProgramHost, RenderDeviceHostImpl, ShaderProgramDesc>;

    ShaderProgramHostImpl(RenderDeviceHostImpl*    pDevice,
                          const ShaderProgramDesc& ProgramDesc);

    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override final
    {
        if (ppInterface == nullptr)
            return;
        if (IID == IID_ShaderProgram || IID == IID_ShaderProgramHost)
        {
            *ppInterface = this;
            (*ppInterface)->AddRef();
        }
        else
        {
            TDeviceObjectBase::QueryInterface(IID, ppInterface);
        }
    }

    virtual Uint32 FindKernel(const Char* Name) const override final;

    virtual Uint32 GetKernelCount() const override final { return static_cast<Uint32>(m_KernelNames.size()); }

    virtual void SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) override final;

    virtual void SetBuffer(Uint32 Kernel, ShaderPropertyID Slot, IBuffer* pBuffer) override final;

    virtual void SetTexture(Uint32 Kernel, ShaderPropertyID Slot, ITexture* pTexture) override final;

    virtual void SetKeyword(const Char* Name, bool Enable) override final;

    virtual const ParameterBlockHost& GetProgramParameters() const override final { return m_ProgramParams; }

    virtual const ParameterBlockHost& GetKernelParameters(Uint32 Kernel) const override final;

private:
    bool CheckKernelIndex(Uint32 Kernel, const Char* MethodName) const;

    std::vector<String>      m_KernelNames;
    std::vector<const Char*> m_KernelNamePtrs;

    ParameterBlockHost              m_ProgramParams;
    std::vector<ParameterBlockHost> m_KernelParams;
};

} // namespace Bindery

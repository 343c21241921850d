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
/// Declaration of Bindery::MaterialHostImpl class

#include "MaterialHost.h"
#include "DeviceObjectBase.hpp"
#include "RenderDeviceHostImpl.hpp"

namespace Bindery
{

/// Material object implementation in the host-memory backend.
class MaterialHostImpl final : public DeviceObjectBase<IMaterialHost, RenderDeviceHostImpl, MaterialDesc>
{
public:
    using TDeviceObjectBase = DeviceObjectBase<IMaterialHost, RenderDeviceHostImpl, MaterialDesc>;

    MaterialHostImpl(RenderDeviceHostImpl* pDevice,
                     const MaterialDesc&   MtrlDesc);

    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override final
    {
        if (ppInterface == nullptr)
            return;
        if (IID == IID_Material || IID == IID_MaterialHost)
        {
            *ppInterface = this;
            (*ppInterface)->AddRef();
        }
        else
        {
            TDeviceObjectBase::QueryInterface(IID, ppInterface);
        }
    }

    virtual void SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) override final
    {
        m_Params.SetConstantBuffer(Slot, pBuffer, Offset, Size);
    }

    virtual void SetBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) override final
    {
        m_Params.SetBuffer(Slot, pBuffer);
    }

    virtual void SetTexture(ShaderPropertyID Slot, ITexture* pTexture) override final
    {
        m_Params.SetTexture(Slot, pTexture);
    }

    virtual void SetKeyword(const Char* Name, bool Enable) override final
    {
        m_Params.SetKeyword(Name, Enable);
    }

    virtual const ParameterBlockHost& GetParameters() const override final { return m_Params; }

private:
    ParameterBlockHost m_Params;
};

} // namespace Bindery

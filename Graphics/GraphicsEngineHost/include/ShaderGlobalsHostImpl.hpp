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
/// Declaration of Bindery::ShaderGlobalsHostImpl class

#include "ShaderGlobalsHost.h"
#include "ObjectBase.hpp"

namespace Bindery
{

/// Pipeline-wide shader state in the host-memory backend. Owned by the render device.
class ShaderGlobalsHostImpl final : public ObjectBase<IShaderGlobalsHost>
{
public:
    using TObjectBase = ObjectBase<IShaderGlobalsHost>;

    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override final
    {
        if (ppInterface == nullptr)
            return;
        if (IID == IID_ShaderGlobals || IID == IID_ShaderGlobalsHost)
        {
            *ppInterface = this;
            (*ppInterface)->AddRef();
        }
        else
        {
            TObjectBase::QueryInterface(IID, ppInterface);
        }
    }

    virtual void SetGlobalConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) override final
    {
        m_Params.SetConstantBuffer(Slot, pBuffer, Offset, Size);
    }

    virtual void SetGlobalBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) override final
    {
        m_Params.SetBuffer(Slot, pBuffer);
    }

    virtual void SetGlobalTexture(ShaderPropertyID Slot, ITexture* pTexture) override final
    {
        m_Params.SetTexture(Slot, pTexture);
    }

    virtual void EnableKeyword(const Char* Name) override final
    {
        m_Params.SetKeyword(Name, true);
    }

    virtual void DisableKeyword(const Char* Name) override final
    {
        m_Params.SetKeyword(Name, false);
    }

    virtual const ParameterBlockHost& GetParameters() const override final { return m_Params; }

    /// Releases all global bindings
    void Reset() { m_Params.Clear(); }

private:
    ParameterBlockHost m_Params;
};

} // namespace Bindery

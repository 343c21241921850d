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


/// \file
/// Routines that initialize the host-memory engine

#include "EngineFactoryHost.h"

#include <cstring>
#include <exception>

#include "RenderDeviceHostImpl.hpp"
#include "DeviceContextHostImpl.hpp"
#include "ObjectBase.hpp"

namespace Bindery
{

/// Engine factory for the host-memory implementation.
class EngineFactoryHostImpl final : public ObjectBase<IEngineFactoryHost>
{
public:
    using TBase = ObjectBase<IEngineFactoryHost>;

    static EngineFactoryHostImpl* GetInstance()
    {
        static EngineFactoryHostImpl TheFactory;
        return &TheFactory;
    }

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_EngineFactoryHost, TBase)

    // The factory is a static object and must never be deleted
    virtual ReferenceCounterValueType AddRef() override final { return 1; }
    virtual ReferenceCounterValueType Release() override final { return 1; }

    virtual void CreateDeviceAndContextsHost(const EngineHostCreateInfo& EngineCI,
                                             IRenderDevice**             ppDevice,
                                             IDeviceContext**            ppContexts) override final;
};


/// Creates render device and device contexts for the host-memory backend

/// \param [in] EngineCI    - Engine creation attributes.
/// \param [out] ppDevice   - Address of the memory location where pointer to
///                           the created device will be written.
/// \param [out] ppContexts - Address of the memory location where pointers to
///                           the contexts will be written. The immediate context goes at
///                           position 0. If EngineCI.NumDeferredContexts > 0,
///                           pointers to the deferred contexts are written afterwards.
void EngineFactoryHostImpl::CreateDeviceAndContextsHost(const EngineHostCreateInfo& EngineCI,
                                                        IRenderDevice**             ppDevice,
                                                        IDeviceContext**            ppContexts)
{
    VERIFY(ppDevice && ppContexts, "Null pointer provided");
    if (!ppDevice || !ppContexts)
        return;

    *ppDevice = nullptr;
    memset(ppContexts, 0, sizeof(*ppContexts) * (size_t{1} + EngineCI.NumDeferredContexts));

    try
    {
        RenderDeviceHostImpl* pRenderDeviceHost = new RenderDeviceHostImpl{EngineCI};
        pRenderDeviceHost->QueryInterface(IID_RenderDevice, reinterpret_cast<IObject**>(ppDevice));

        DeviceContextHostImpl* pImmediateCtxHost = new DeviceContextHostImpl{pRenderDeviceHost, DeviceContextDesc{"Immediate context", false, 0}};
        pImmediateCtxHost->QueryInterface(IID_DeviceContext, reinterpret_cast<IObject**>(ppContexts));

        for (Uint32 DeferredCtx = 0; DeferredCtx < EngineCI.NumDeferredContexts; ++DeferredCtx)
        {
            const auto CtxName = FormatString("Deferred context ", DeferredCtx);

            DeviceContextHostImpl* pDeferredCtxHost = new DeviceContextHostImpl{pRenderDeviceHost, DeviceContextDesc{CtxName.c_str(), true, 1 + DeferredCtx}};
            pDeferredCtxHost->QueryInterface(IID_DeviceContext, reinterpret_cast<IObject**>(ppContexts + 1 + DeferredCtx));
        }
    }
    catch (const std::exception& err)
    {
        for (Uint32 ctx = 0; ctx < 1 + EngineCI.NumDeferredContexts; ++ctx)
        {
            if (ppContexts[ctx] != nullptr)
            {
                ppContexts[ctx]->Release();
                ppContexts[ctx] = nullptr;
            }
        }

        if (*ppDevice)
        {
            (*ppDevice)->Release();
            *ppDevice = nullptr;
        }

        LOG_ERROR("Failed to create device and contexts: ", err.what());
    }
}


IEngineFactoryHost* GetEngineFactoryHost()
{
    return EngineFactoryHostImpl::GetInstance();
}

} // namespace Bindery

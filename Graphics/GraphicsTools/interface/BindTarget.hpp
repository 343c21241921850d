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
/// Definition of the Bindery::BindTarget class

#include "../../GraphicsEngine/interface/ShaderProgram.h"
#include "../../GraphicsEngine/interface/DeviceContext.h"
#include "../../GraphicsEngine/interface/ShaderGlobals.h"
#include "../../GraphicsEngine/interface/Material.h"

namespace Bindery
{

/// Bind target type
enum BIND_TARGET_TYPE : Uint8
{
    /// Binds directly to one kernel of a shader program.
    BIND_TARGET_DISPATCH = 0,

    /// Records program bindings into a device context.
    BIND_TARGET_COMMAND_LIST_DISPATCH,

    /// Binds to the pipeline-wide shader state.
    BIND_TARGET_GLOBAL,

    /// Records global bindings into a device context.
    BIND_TARGET_COMMAND_LIST_GLOBAL,

    /// Binds to the parameter block of a material instance.
    BIND_TARGET_MATERIAL,

    BIND_TARGET_TYPE_COUNT
};

/// Returns the literal name of the bind target type, e.g. "Dispatch"
const Char* GetBindTargetTypeString(BIND_TARGET_TYPE Type);


/// Destination of shader resource bindings.

/// A bind target routes the same four binding operations to one of several
/// submission surfaces. It only references the objects it binds to and
/// does not keep them alive: construct it where the bindings are made.
///
/// \remarks Bind targets do not validate bound resources. The caller must
///          make sure that all buffers and textures are alive.
class BindTarget
{
public:
    /// Binds to the given kernel of the program. Constant buffers and keywords are program-wide.
    static BindTarget Dispatch(IShaderProgram* pProgram, Uint32 Kernel);

    /// Records program bindings for the given kernel into the context.
    static BindTarget CommandListDispatch(IDeviceContext* pContext, IShaderProgram* pProgram, Uint32 Kernel);

    /// Binds to the pipeline-wide shader state.
    static BindTarget Global(IShaderGlobals* pGlobals);

    /// Records global bindings into the context.
    static BindTarget CommandListGlobal(IDeviceContext* pContext);

    /// Binds to the material instance.
    static BindTarget Material(IMaterial* pMaterial);

    /// Binds the buffer as a constant buffer. The bound range starts at offset 0
    /// and spans one element of the buffer.
    void BindConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) const;

    /// Binds the buffer as a read-write compute buffer.
    void BindComputeBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) const;

    /// Binds the texture as a read-write image.
    void BindComputeTexture(ShaderPropertyID Slot, ITexture* pTexture) const;

    /// Enables or disables the keyword in the scope of the target.
    void BindKeyword(const Char* Name, bool Enable) const;

    BIND_TARGET_TYPE GetType() const { return m_Type; }

private:
    struct DispatchAttribs
    {
        IShaderProgram* pProgram;
        Uint32          Kernel;
    };

    struct CommandListDispatchAttribs
    {
        IDeviceContext* pContext;
        IShaderProgram* pProgram;
        Uint32          Kernel;
    };

    struct GlobalAttribs
    {
        IShaderGlobals* pGlobals;
    };

    struct CommandListGlobalAttribs
    {
        IDeviceContext* pContext;
    };

    struct MaterialAttribs
    {
        IMaterial* pMaterial;
    };

    explicit BindTarget(BIND_TARGET_TYPE Type) noexcept :
        m_Type{Type}
    {}

    BIND_TARGET_TYPE m_Type;

    union
    {
        DispatchAttribs            m_Dispatch;
        CommandListDispatchAttribs m_CmdListDispatch;
        GlobalAttribs              m_Global;
        CommandListGlobalAttribs   m_CmdListGlobal;
        MaterialAttribs            m_Material;
    };
};

} // namespace Bindery

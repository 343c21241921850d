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


#include "BindTarget.hpp"
#include "ComputeResources.hpp"
#include "ShaderProperties.hpp"
#include "ShaderProgramHost.h"
#include "ShaderGlobalsHost.h"
#include "MaterialHost.h"

#include "TestingEnvironment.hpp"
#include "CapturingBindings.hpp"

#include "gtest/gtest.h"

using namespace Bindery;
using namespace Bindery::Testing;

namespace
{

class BindTargetTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        ComputeResourceManager ResMgr{TestingEnvironment::GetInstance()->GetDevice()};
        ResMgr.CreateBuffer(sm_pConstants, "Constants", 1, 64, COMPUTE_BUFFER_TYPE_CONSTANT);
        ResMgr.CreateBuffer(sm_pParticles, "Particles", 256, 16);
        ResMgr.CreateVolume(sm_pVolume, "Volume", 8, RTF_ARGB_HALF);
    }

    static void TearDownTestSuite()
    {
        sm_pConstants.Release();
        sm_pParticles.Release();
        sm_pVolume.Release();
    }

    // Performs the same sequence of bindings on any target
    static void BindAll(const BindTarget& Target)
    {
        Target.BindConstantBuffer(GetShaderPropertyID("_SimulationConstants"), sm_pConstants);
        Target.BindComputeBuffer(GetShaderPropertyID("_Particles"), sm_pParticles);
        Target.BindComputeTexture(GetShaderPropertyID("_Volume"), sm_pVolume);
        Target.BindKeyword("ENABLE_X", true);
    }

    static void VerifyBufferCall(const CapturedCall& Call, const char* Method, const IObject* pTarget, const char* Slot, IBuffer* pBuffer)
    {
        EXPECT_EQ(Call.Method, Method);
        EXPECT_EQ(Call.pTarget, pTarget);
        EXPECT_EQ(Call.Slot, GetShaderPropertyID(Slot));
        EXPECT_EQ(Call.pResource, pBuffer);
    }

    static RefCntAutoPtr<IBuffer>  sm_pConstants;
    static RefCntAutoPtr<IBuffer>  sm_pParticles;
    static RefCntAutoPtr<ITexture> sm_pVolume;
};

RefCntAutoPtr<IBuffer>  BindTargetTest::sm_pConstants;
RefCntAutoPtr<IBuffer>  BindTargetTest::sm_pParticles;
RefCntAutoPtr<ITexture> BindTargetTest::sm_pVolume;


TEST_F(BindTargetTest, TypeStrings)
{
    EXPECT_STREQ(GetBindTargetTypeString(BIND_TARGET_DISPATCH), "Dispatch");
    EXPECT_STREQ(GetBindTargetTypeString(BIND_TARGET_COMMAND_LIST_DISPATCH), "Command list dispatch");
    EXPECT_STREQ(GetBindTargetTypeString(BIND_TARGET_GLOBAL), "Global");
    EXPECT_STREQ(GetBindTargetTypeString(BIND_TARGET_COMMAND_LIST_GLOBAL), "Command list global");
    EXPECT_STREQ(GetBindTargetTypeString(BIND_TARGET_MATERIAL), "Material");
}

TEST_F(BindTargetTest, Dispatch)
{
    RefCntAutoPtr<CapturingShaderProgram> pProgram{new CapturingShaderProgram};

    const auto Target = BindTarget::Dispatch(pProgram, 0);
    EXPECT_EQ(Target.GetType(), BIND_TARGET_DISPATCH);
    BindAll(Target);

    const auto& Calls = pProgram->Calls;
    ASSERT_EQ(Calls.size(), 4u);
    VerifyBufferCall(Calls[0], "SetConstantBuffer", pProgram, "_SimulationConstants", sm_pConstants);
    EXPECT_EQ(Calls[0].Offset, 0u);
    EXPECT_EQ(Calls[0].Size, 64u);
    VerifyBufferCall(Calls[1], "SetBuffer", pProgram, "_Particles", sm_pParticles);
    EXPECT_EQ(Calls[1].Kernel, 0u);
    EXPECT_EQ(Calls[2].Method, "SetTexture");
    EXPECT_EQ(Calls[2].Kernel, 0u);
    EXPECT_EQ(Calls[2].pResource, sm_pVolume);
    EXPECT_EQ(Calls[3].Method, "SetKeyword");
    EXPECT_EQ(Calls[3].Keyword, "ENABLE_X");
    EXPECT_TRUE(Calls[3].Enable);
}

TEST_F(BindTargetTest, CommandListDispatch)
{
    RefCntAutoPtr<CapturingShaderProgram> pProgram{new CapturingShaderProgram};
    RefCntAutoPtr<CapturingDeviceContext> pContext{new CapturingDeviceContext};

    const auto Target = BindTarget::CommandListDispatch(pContext, pProgram, 0);
    EXPECT_EQ(Target.GetType(), BIND_TARGET_COMMAND_LIST_DISPATCH);
    BindAll(Target);

    // Nothing reaches the program directly
    EXPECT_TRUE(pProgram->Calls.empty());

    const auto& Calls = pContext->Calls;
    ASSERT_EQ(Calls.size(), 4u);
    VerifyBufferCall(Calls[0], "SetProgramConstantBuffer", pProgram, "_SimulationConstants", sm_pConstants);
    EXPECT_EQ(Calls[0].Size, 64u);
    VerifyBufferCall(Calls[1], "SetProgramBuffer", pProgram, "_Particles", sm_pParticles);
    EXPECT_EQ(Calls[1].Kernel, 0u);
    EXPECT_EQ(Calls[2].Method, "SetProgramTexture");
    EXPECT_EQ(Calls[2].pTarget, pProgram);
    EXPECT_EQ(Calls[3].Method, "SetProgramKeyword");
    EXPECT_EQ(Calls[3].pTarget, pProgram);
    EXPECT_EQ(Calls[3].Keyword, "ENABLE_X");
}

TEST_F(BindTargetTest, Global)
{
    RefCntAutoPtr<CapturingShaderGlobals> pGlobals{new CapturingShaderGlobals};

    const auto Target = BindTarget::Global(pGlobals);
    EXPECT_EQ(Target.GetType(), BIND_TARGET_GLOBAL);
    BindAll(Target);
    Target.BindKeyword("ENABLE_X", false);

    const auto& Calls = pGlobals->Calls;
    ASSERT_EQ(Calls.size(), 5u);
    VerifyBufferCall(Calls[0], "SetGlobalConstantBuffer", pGlobals, "_SimulationConstants", sm_pConstants);
    EXPECT_EQ(Calls[0].Size, 64u);
    VerifyBufferCall(Calls[1], "SetGlobalBuffer", pGlobals, "_Particles", sm_pParticles);
    EXPECT_EQ(Calls[2].Method, "SetGlobalTexture");
    EXPECT_EQ(Calls[3].Method, "EnableKeyword");
    EXPECT_EQ(Calls[4].Method, "DisableKeyword");
    EXPECT_EQ(Calls[4].Keyword, "ENABLE_X");
}

TEST_F(BindTargetTest, CommandListGlobal)
{
    RefCntAutoPtr<CapturingDeviceContext> pContext{new CapturingDeviceContext};

    const auto Target = BindTarget::CommandListGlobal(pContext);
    EXPECT_EQ(Target.GetType(), BIND_TARGET_COMMAND_LIST_GLOBAL);
    BindAll(Target);

    const auto& Calls = pContext->Calls;
    ASSERT_EQ(Calls.size(), 4u);
    VerifyBufferCall(Calls[0], "SetGlobalConstantBuffer", pContext, "_SimulationConstants", sm_pConstants);
    EXPECT_EQ(Calls[0].Offset, 0u);
    EXPECT_EQ(Calls[0].Size, 64u);
    VerifyBufferCall(Calls[1], "SetGlobalBuffer", pContext, "_Particles", sm_pParticles);
    EXPECT_EQ(Calls[2].Method, "SetGlobalTexture");
    EXPECT_EQ(Calls[2].pResource, sm_pVolume);
    EXPECT_EQ(Calls[3].Method, "SetGlobalKeyword");
    EXPECT_TRUE(Calls[3].Enable);
}

TEST_F(BindTargetTest, Material)
{
    RefCntAutoPtr<CapturingMaterial> pMaterial{new CapturingMaterial};

    const auto Target = BindTarget::Material(pMaterial);
    EXPECT_EQ(Target.GetType(), BIND_TARGET_MATERIAL);
    BindAll(Target);

    const auto& Calls = pMaterial->Calls;
    ASSERT_EQ(Calls.size(), 4u);
    VerifyBufferCall(Calls[0], "SetConstantBuffer", pMaterial, "_SimulationConstants", sm_pConstants);
    EXPECT_EQ(Calls[0].Size, 64u);
    VerifyBufferCall(Calls[1], "SetBuffer", pMaterial, "_Particles", sm_pParticles);
    EXPECT_EQ(Calls[2].Method, "SetTexture");
    EXPECT_EQ(Calls[3].Method, "SetKeyword");
}


// The tests below route bindings to the host backend and inspect the resulting state

TEST_F(BindTargetTest, HostDispatch)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    const Char*                   KernelNames[] = {"Integrate", "Constrain"};
    RefCntAutoPtr<IShaderProgram> pProgram;
    pDevice->CreateShaderProgram(ShaderProgramDesc{"Simulation", KernelNames, 2}, &pProgram);
    ASSERT_NE(pProgram, nullptr);
    RefCntAutoPtr<IShaderProgramHost> pProgramHost{pProgram, IID_ShaderProgramHost};
    ASSERT_NE(pProgramHost, nullptr);

    const auto Constrain = pProgram->FindKernel("Constrain");
    ASSERT_EQ(Constrain, 1u);
    BindAll(BindTarget::Dispatch(pProgram, Constrain));

    const auto& KernelParams = pProgramHost->GetKernelParameters(Constrain);
    EXPECT_EQ(KernelParams.GetBuffer(GetShaderPropertyID("_Particles")), sm_pParticles);
    EXPECT_EQ(KernelParams.GetTexture(GetShaderPropertyID("_Volume")), sm_pVolume);
    // Other kernels are not affected
    EXPECT_EQ(pProgramHost->GetKernelParameters(0).GetBuffer(GetShaderPropertyID("_Particles")), nullptr);

    const auto& ProgramParams = pProgramHost->GetProgramParameters();
    const auto* pCB           = ProgramParams.GetConstantBuffer(GetShaderPropertyID("_SimulationConstants"));
    ASSERT_NE(pCB, nullptr);
    EXPECT_EQ(pCB->pBuffer, sm_pConstants);
    EXPECT_EQ(pCB->Offset, 0u);
    EXPECT_EQ(pCB->Size, 64u);
    EXPECT_TRUE(ProgramParams.IsKeywordEnabled("ENABLE_X"));
}

TEST_F(BindTargetTest, HostCommandListDispatch)
{
    auto* pEnv      = TestingEnvironment::GetInstance();
    auto* pDevice   = pEnv->GetDevice();
    auto* pDeferred = pEnv->GetDeferredContext(0);

    const Char*                   KernelNames[] = {"Main"};
    RefCntAutoPtr<IShaderProgram> pProgram;
    pDevice->CreateShaderProgram(ShaderProgramDesc{"Simulation", KernelNames, 1}, &pProgram);
    ASSERT_NE(pProgram, nullptr);
    RefCntAutoPtr<IShaderProgramHost> pProgramHost{pProgram, IID_ShaderProgramHost};

    const auto Target = BindTarget::CommandListDispatch(pDeferred, pProgram, 0);
    BindAll(Target);
    Target.BindKeyword("ENABLE_X", false);

    // Recorded, not applied
    const auto ParticlesID = GetShaderPropertyID("_Particles");
    EXPECT_EQ(pProgramHost->GetKernelParameters(0).GetBuffer(ParticlesID), nullptr);

    RefCntAutoPtr<ICommandList> pCmdList;
    pDeferred->FinishCommandList(&pCmdList);
    ASSERT_NE(pCmdList, nullptr);
    pEnv->GetImmediateContext()->ExecuteCommandList(pCmdList);

    EXPECT_EQ(pProgramHost->GetKernelParameters(0).GetBuffer(ParticlesID), sm_pParticles);
    EXPECT_EQ(pProgramHost->GetKernelParameters(0).GetTexture(GetShaderPropertyID("_Volume")), sm_pVolume);
    // Commands are executed in recording order
    EXPECT_FALSE(pProgramHost->GetProgramParameters().IsKeywordEnabled("ENABLE_X"));
}

TEST_F(BindTargetTest, HostGlobal_LastWriteWins)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    RefCntAutoPtr<IShaderGlobalsHost> pGlobalsHost{pDevice->GetShaderGlobals(), IID_ShaderGlobalsHost};
    ASSERT_NE(pGlobalsHost, nullptr);

    const auto Target = BindTarget::Global(pDevice->GetShaderGlobals());
    Target.BindKeyword("ENABLE_X", true);
    EXPECT_TRUE(pGlobalsHost->GetParameters().IsKeywordEnabled("ENABLE_X"));
    Target.BindKeyword("ENABLE_X", false);
    EXPECT_FALSE(pGlobalsHost->GetParameters().IsKeywordEnabled("ENABLE_X"));
    EXPECT_FALSE(pGlobalsHost->GetParameters().IsKeywordEnabled(nullptr));

    const auto SlotID = GetShaderPropertyID("_GlobalParticles");
    Target.BindComputeBuffer(SlotID, sm_pParticles);
    Target.BindComputeBuffer(SlotID, sm_pConstants);
    EXPECT_EQ(pGlobalsHost->GetParameters().GetBuffer(SlotID), sm_pConstants);

    Target.BindComputeBuffer(SlotID, nullptr);
    EXPECT_EQ(pGlobalsHost->GetParameters().GetBuffer(SlotID), nullptr);
}

TEST_F(BindTargetTest, HostCommandListGlobal)
{
    auto* pEnv    = TestingEnvironment::GetInstance();
    auto* pDevice = pEnv->GetDevice();

    RefCntAutoPtr<IShaderGlobalsHost> pGlobalsHost{pDevice->GetShaderGlobals(), IID_ShaderGlobalsHost};
    ASSERT_NE(pGlobalsHost, nullptr);

    const auto SlotID = GetShaderPropertyID("_DeferredGlobalVolume");

    auto* pDeferred = pEnv->GetDeferredContext(1);
    BindTarget::CommandListGlobal(pDeferred).BindComputeTexture(SlotID, sm_pVolume);
    BindTarget::CommandListGlobal(pDeferred).BindKeyword("ENABLE_DEFERRED_X", true);
    EXPECT_EQ(pGlobalsHost->GetParameters().GetTexture(SlotID), nullptr);
    EXPECT_FALSE(pGlobalsHost->GetParameters().IsKeywordEnabled("ENABLE_DEFERRED_X"));

    RefCntAutoPtr<ICommandList> pCmdList;
    pDeferred->FinishCommandList(&pCmdList);
    ASSERT_NE(pCmdList, nullptr);
    pEnv->GetImmediateContext()->ExecuteCommandList(pCmdList);

    EXPECT_EQ(pGlobalsHost->GetParameters().GetTexture(SlotID), sm_pVolume);
    EXPECT_TRUE(pGlobalsHost->GetParameters().IsKeywordEnabled("ENABLE_DEFERRED_X"));

    // The immediate context applies global bindings right away
    BindTarget::CommandListGlobal(pEnv->GetImmediateContext()).BindKeyword("ENABLE_DEFERRED_X", false);
    EXPECT_FALSE(pGlobalsHost->GetParameters().IsKeywordEnabled("ENABLE_DEFERRED_X"));
    BindTarget::CommandListGlobal(pEnv->GetImmediateContext()).BindComputeTexture(SlotID, nullptr);
}

TEST_F(BindTargetTest, HostMaterial)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    RefCntAutoPtr<IMaterial> pMaterial0;
    RefCntAutoPtr<IMaterial> pMaterial1;
    pDevice->CreateMaterial(MaterialDesc{"Strands 0"}, &pMaterial0);
    pDevice->CreateMaterial(MaterialDesc{"Strands 1"}, &pMaterial1);
    ASSERT_NE(pMaterial0, nullptr);
    ASSERT_NE(pMaterial1, nullptr);

    BindAll(BindTarget::Material(pMaterial0));

    RefCntAutoPtr<IMaterialHost> pMaterialHost0{pMaterial0, IID_MaterialHost};
    RefCntAutoPtr<IMaterialHost> pMaterialHost1{pMaterial1, IID_MaterialHost};
    ASSERT_NE(pMaterialHost0, nullptr);
    ASSERT_NE(pMaterialHost1, nullptr);

    EXPECT_EQ(pMaterialHost0->GetParameters().GetBuffer(GetShaderPropertyID("_Particles")), sm_pParticles);
    EXPECT_TRUE(pMaterialHost0->GetParameters().IsKeywordEnabled("ENABLE_X"));
    // Keywords are local to the instance
    EXPECT_FALSE(pMaterialHost1->GetParameters().IsKeywordEnabled("ENABLE_X"));
    EXPECT_EQ(pMaterialHost1->GetParameters().GetNumEnabledKeywords(), 0u);
}

} // namespace
